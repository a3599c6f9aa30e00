#ifndef ALLOC_MEM_PROGRESS_REPORTER_H
#define ALLOC_MEM_PROGRESS_REPORTER_H

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>

#include "memory_stats.h"

namespace alloc_mem {

/**
 * @brief 启动时的分配计划
 */
struct AllocPlan {
    int64_t target_blocks = 0;      // 0 表示无限
    int block_size_mb = 0;
    long long max_commit_mb = 0;
    double touch_fill_ratio = 0.0;
    int delay_ms = 0;
    uint64_t registry_bytes = 0;    // 块登记表自身的预估占用
};

/**
 * @brief 单个块分配完成后的进度
 */
struct BlockProgress {
    int64_t block_no = 0;           // 从 0 开始
    int block_size_mb = 0;
    double touch_fill_ratio = 0.0;
    std::size_t touched_pages = 0;
    long long total_allocated_mb = 0;
    double total_touched_mb = 0.0;
};

/**
 * @brief 进度输出
 *
 * 两种格式:
 * - 文本 (默认): 人类可读，每个事件一行
 * - JSON Lines: 每行一个对象，"event" 字段区分事件类型
 */
class ProgressReporter {
public:
    ProgressReporter(std::ostream& out, bool json);

    void Startup(const AllocPlan& plan);
    void Block(const BlockProgress& progress);
    void Stats(const MemoryStats& stats, const std::string& when);
    void Complete(int64_t blocks, long long total_allocated_mb);
    void Shutdown(int signo, int64_t blocks);
    void ConfigError(const std::string& message);

    bool IsJson() const { return json_; }

    /**
     * @brief 最多保留两位小数并去掉末尾的 0 (2.50 -> "2.5", 3.00 -> "3")
     */
    static std::string FormatMB(double mb);

private:
    std::ostream& out_;
    bool json_;
};

} // namespace alloc_mem

#endif // ALLOC_MEM_PROGRESS_REPORTER_H
