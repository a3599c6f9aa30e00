#ifndef ALLOC_MEM_ALLOC_LOOP_H
#define ALLOC_MEM_ALLOC_LOOP_H

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "alloc_internal.h"

namespace alloc_mem {

class MemoryStatsProvider;
class ProgressReporter;
class ShutdownSignal;

/**
 * @brief 一个已分配的内存块
 * 创建后不再修改，也不会单独释放
 */
struct Block {
    std::unique_ptr<std::int32_t[]> data;
    std::size_t elements = 0;
    std::size_t touched = 0;    // 被写入的页数
};

enum class LoopStatus {
    CONFIG_ERROR,   // 参数非法，未分配任何块
    SHUTDOWN        // 收到关闭信号，正常返回
};

/**
 * @brief 分配循环
 *
 * 核心流程:
 * 1. 校验块大小 (超过 kMaxBlockSizeMB 直接失败)
 * 2. 计算目标块数 (max_commit_mb == 0 时无限分配)
 * 3. 按目标块数预留登记表容量，避免扩容拷贝干扰内存曲线
 * 4. 循环: 延时 -> 分配 -> touch -> 登记 -> 输出进度
 * 5. 达到目标后阻塞等待关闭信号
 *
 * 关闭请求只在块与块之间检查，有上限时也一样: 收到信号后不再分配新块，
 * 已分配的块继续持有，直到进程正常退出。
 *
 * 登记表只增不减，块在进程退出时统一释放。
 * 分配失败 (std::bad_alloc / OOM killer) 不做捕获，这正是工具要观测的结果。
 */
class AllocationLoop {
public:
    /**
     * @param opts 已校验的运行参数
     * @param shutdown 关闭通知，由信号监听线程触发
     * @param stats 内存统计来源，可为 nullptr
     * @param reporter 进度输出
     */
    AllocationLoop(const AllocOptions& opts,
                   ShutdownSignal& shutdown,
                   MemoryStatsProvider* stats,
                   ProgressReporter& reporter);

    AllocationLoop(const AllocationLoop&) = delete;
    AllocationLoop& operator=(const AllocationLoop&) = delete;

    /**
     * @brief 执行分配并等待关闭信号
     *
     * 在当前线程阻塞，直到 ShutdownSignal 被触发
     * (或参数非法时立即返回)。
     */
    LoopStatus Run();

    /**
     * @brief 已分配的块数，可在其它线程读取
     */
    int64_t BlocksAllocated() const { return blocks_allocated_.load(); }

    /**
     * @brief 分配循环是否已经退出 (之后只剩等待关闭信号)
     */
    bool LoopFinished() const { return loop_finished_.load(); }

    /**
     * @brief 目标块数，0 表示无限
     */
    int64_t TargetBlocks() const { return target_blocks_; }

    /**
     * @brief 块登记表，仅在 Run() 返回后读取
     */
    const std::vector<Block>& Registry() const { return registry_; }

    // 无上限模式下登记表的预留容量
    static constexpr std::size_t kUnboundedReserve = 1024;

    // 有上限时预留容量的上限，超出部分由 vector 自行扩容
    static constexpr std::size_t kMaxReserve = 65536;

private:
    void AllocateBlock(int64_t block_no);
    void ReportStats(const std::string& when);

private:
    AllocOptions opts_;
    ShutdownSignal& shutdown_;
    MemoryStatsProvider* stats_;
    ProgressReporter& reporter_;

    int64_t elements_per_block_ = 0;
    int64_t target_blocks_ = 0;
    bool unbounded_ = false;

    std::vector<Block> registry_;
    std::atomic<int64_t> blocks_allocated_{0};
    std::atomic<bool> loop_finished_{false};
};

} // namespace alloc_mem

#endif // ALLOC_MEM_ALLOC_LOOP_H
