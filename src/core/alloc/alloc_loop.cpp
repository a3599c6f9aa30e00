#include "alloc_loop.h"

#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

#include "block_sizer.h"
#include "memory_stats.h"
#include "progress_reporter.h"
#include "shutdown_signal.h"

namespace alloc_mem {

AllocationLoop::AllocationLoop(const AllocOptions& opts,
                               ShutdownSignal& shutdown,
                               MemoryStatsProvider* stats,
                               ProgressReporter& reporter)
    : opts_(opts)
    , shutdown_(shutdown)
    , stats_(stats)
    , reporter_(reporter)
{
}

LoopStatus AllocationLoop::Run() {
    // 1. 校验块大小，失败时不做任何分配
    if (opts_.block_size_mb <= 0) {
        std::cerr << "[AllocLoop] Rejected block size " << opts_.block_size_mb << " MB" << std::endl;
        reporter_.ConfigError("Input block size must be a positive number of MB");
        return LoopStatus::CONFIG_ERROR;
    }
    if (!IsValidBlockSize(opts_.block_size_mb)) {
        std::cerr << "[AllocLoop] Rejected block size " << opts_.block_size_mb
                  << " MB (ceiling " << kMaxBlockSizeMB << " MB)" << std::endl;
        reporter_.ConfigError("Input block size too large. Maximum allowed value is "
                              + std::to_string(kMaxBlockSizeMB) + " MB");
        return LoopStatus::CONFIG_ERROR;
    }

    // 2. 计算每块元素数与目标块数
    elements_per_block_ = ElementsPerBlock(opts_.block_size_mb);
    unbounded_ = opts_.max_commit_mb == 0;
    target_blocks_ = TargetBlockCount(opts_.max_commit_mb, opts_.block_size_mb);

    // 3. 预留登记表容量
    std::size_t reserve = kUnboundedReserve;
    if (!unbounded_) {
        reserve = target_blocks_ < static_cast<int64_t>(kMaxReserve)
                      ? static_cast<std::size_t>(target_blocks_)
                      : kMaxReserve;
    }
    registry_.reserve(reserve);

    std::cerr << "[AllocLoop] " << elements_per_block_ << " elements per block, target "
              << (unbounded_ ? std::string("unbounded") : std::to_string(target_blocks_))
              << " blocks" << std::endl;

    AllocPlan plan;
    plan.target_blocks = target_blocks_;
    plan.block_size_mb = opts_.block_size_mb;
    plan.max_commit_mb = opts_.max_commit_mb;
    plan.touch_fill_ratio = opts_.touch_fill_ratio;
    plan.delay_ms = opts_.delay_ms;
    plan.registry_bytes = sizeof(registry_) + registry_.capacity() * sizeof(Block);
    reporter_.Startup(plan);

    // 4. 分配循环，只在块与块之间响应关闭请求
    for (int64_t block_no = 0; unbounded_ || block_no < target_blocks_; ++block_no) {
        if (shutdown_.IsRequested()) {
            std::cerr << "[AllocLoop] Shutdown requested, stopping at block " << block_no << std::endl;
            break;
        }
        // 第一个块立即分配，之后每块前等待 delay_ms
        if (block_no != 0 && opts_.delay_ms > 0) {
            if (shutdown_.WaitFor(std::chrono::milliseconds(opts_.delay_ms))) {
                std::cerr << "[AllocLoop] Shutdown requested, stopping at block " << block_no << std::endl;
                break;
            }
        }

        AllocateBlock(block_no);

        if (opts_.stats_interval > 0 && (block_no + 1) % opts_.stats_interval == 0) {
            ReportStats("block " + std::to_string(block_no));
        }
    }
    loop_finished_ = true;

    // 5. 达到目标 (非信号打断) 时报告完成
    if (!shutdown_.IsRequested()) {
        reporter_.Complete(BlocksAllocated(), BlocksAllocated() * opts_.block_size_mb);
        ReportStats("complete");
    }

    // 6. 持有全部内存直到收到关闭信号
    shutdown_.Wait();
    reporter_.Shutdown(shutdown_.Signal(), BlocksAllocated());
    ReportStats("shutdown");
    return LoopStatus::SHUTDOWN;
}

void AllocationLoop::AllocateBlock(int64_t block_no) {
    Block block;
    block.elements = static_cast<std::size_t>(elements_per_block_);
    // 不做值初始化 (make_unique 会清零并触碰所有页)，只有 touch 过的页才会被实际提交
    block.data = std::make_unique_for_overwrite<std::int32_t[]>(block.elements);
    block.touched = TouchBlock(block.data.get(), block.elements, opts_.touch_fill_ratio);

    registry_.push_back(std::move(block));
    blocks_allocated_ = static_cast<int64_t>(registry_.size());

    const long long allocated = static_cast<long long>(block_no + 1) * opts_.block_size_mb;

    BlockProgress progress;
    progress.block_no = block_no;
    progress.block_size_mb = opts_.block_size_mb;
    progress.touch_fill_ratio = opts_.touch_fill_ratio;
    progress.touched_pages = registry_.back().touched;
    progress.total_allocated_mb = allocated;
    progress.total_touched_mb = static_cast<double>(allocated) * opts_.touch_fill_ratio;
    reporter_.Block(progress);
}

void AllocationLoop::ReportStats(const std::string& when) {
    if (stats_ == nullptr) {
        return;
    }
    MemoryStats snapshot;
    if (!stats_->Snapshot(snapshot)) {
        std::cerr << "[MemStats] Snapshot unavailable (" << when << ")" << std::endl;
        return;
    }
    reporter_.Stats(snapshot, when);
}

} // namespace alloc_mem
