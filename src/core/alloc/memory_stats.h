#ifndef ALLOC_MEM_MEMORY_STATS_H
#define ALLOC_MEM_MEMORY_STATS_H

#include <cstdint>
#include <string>

namespace alloc_mem {

/**
 * @brief 进程内存快照
 * 单位与来源保持一致: /proc/self/status 为 KB，cgroup 为字节
 */
struct MemoryStats {
    uint64_t vm_size_kb = 0;     ///< VmSize: 虚拟地址空间 (已提交)
    uint64_t vm_rss_kb = 0;      ///< VmRSS: 常驻内存
    uint64_t rss_anon_kb = 0;    ///< RssAnon: 匿名页常驻部分
    uint64_t vm_hwm_kb = 0;      ///< VmHWM: 常驻内存峰值

    uint64_t minor_faults = 0;   ///< ru_minflt
    uint64_t major_faults = 0;   ///< ru_majflt

    bool has_cgroup = false;
    uint64_t cgroup_current_bytes = 0; ///< memory.current
    uint64_t cgroup_max_bytes = 0;     ///< memory.max, 0 表示 "max" 或未知
};

/**
 * @brief 内存统计来源 (注入到 AllocationLoop)
 */
class MemoryStatsProvider {
public:
    virtual ~MemoryStatsProvider() = default;

    /**
     * @brief 获取一次快照
     * @return false 表示完全不可用 (此时不输出统计)
     */
    virtual bool Snapshot(MemoryStats& stats) = 0;
};

/**
 * @brief 基于 procfs / getrusage / cgroup v2 的实现
 *
 * 数据来源:
 * - /proc/self/status: VmSize, VmRSS, RssAnon, VmHWM
 * - getrusage(RUSAGE_SELF): 缺页次数
 * - /proc/self/cgroup 中 "0::/path" 定位的 memory.current / memory.max
 *
 * 任一来源缺失只会让对应字段为 0，不视为错误。
 */
class ProcMemoryStats : public MemoryStatsProvider {
public:
    /**
     * @param proc_root procfs 挂载点，测试时可替换
     * @param cgroup_root cgroup v2 挂载点
     */
    explicit ProcMemoryStats(const std::string& proc_root = "/proc",
                             const std::string& cgroup_root = "/sys/fs/cgroup");

    bool Snapshot(MemoryStats& stats) override;

    /**
     * @brief 解析 /proc/<pid>/status 格式的文本
     * @return true 如果至少解析到 VmRSS
     */
    static bool ParseProcStatus(const std::string& content, MemoryStats& stats);

    /**
     * @brief 从 /proc/self/cgroup 内容中取出 cgroup v2 路径
     * @return 例如 "/docker/abc"，不是 v2 时返回空串
     */
    static std::string ParseCgroupPath(const std::string& content);

private:
    void ReadCgroup(MemoryStats& stats) const;
    static std::string ReadFromFile(const std::string& path, bool whole_file);

private:
    std::string proc_root_;
    std::string cgroup_root_;
};

} // namespace alloc_mem

#endif // ALLOC_MEM_MEMORY_STATS_H
