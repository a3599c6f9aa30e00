#ifndef ALLOC_MEM_ALLOC_INTERNAL_H
#define ALLOC_MEM_ALLOC_INTERNAL_H

#include <string>

namespace alloc_mem {

    // 退出状态码定义
    enum AllocExitCode {
        EXIT_OK          = 0, // 正常退出 (收到关闭信号后)
        ERR_USAGE        = 1, // 命令行参数错误
        ERR_CONFIG       = 2, // 配置非法 (块大小越界等)，未分配任何内存
        ERR_SIGNAL_SETUP = 3  // 信号屏蔽 / 监听线程初始化失败
    };

    /**
     * @brief 运行参数
     * 默认值 < YAML 配置文件 < 环境变量 < 命令行
     */
    struct AllocOptions {
        int block_size_mb = 1;          // 每个内存块大小 (MB)
        double touch_fill_ratio = 1.0;  // 每块中被写入 (touch) 的比例 [0,1]
        int delay_ms = 0;               // 两次分配之间的间隔 (毫秒)
        long long max_commit_mb = 0;    // 提交上限 (MB)，0 表示无限分配
        bool has_max_commit = false;    // max_commit_mb 为必填项

        bool break_after_start = false; // 分配前暂停，便于观察基线内存
        int stats_interval = 10;        // 每 N 个块输出一次进程内存统计，0 关闭
        bool json_output = false;       // 以 JSON Lines 输出进度
    };

    /**
     * @brief 从 YAML 文件加载配置，覆盖 opts 中对应字段
     * @return false 时 err 中包含原因
     */
    bool LoadConfig(const std::string& path, AllocOptions& opts, std::string& err);

    /**
     * @brief 读取 ALLOC_MEM_* 环境变量覆盖配置
     */
    bool ApplyEnvOverrides(AllocOptions& opts, std::string& err);

    /**
     * @brief 校验参数合法性
     */
    bool ValidateOptions(const AllocOptions& opts, std::string& err);

} // namespace alloc_mem

#endif // ALLOC_MEM_ALLOC_INTERNAL_H
