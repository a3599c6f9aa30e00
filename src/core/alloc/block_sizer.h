#ifndef ALLOC_MEM_BLOCK_SIZER_H
#define ALLOC_MEM_BLOCK_SIZER_H

#include <cstddef>
#include <cstdint>

namespace alloc_mem {

    // 每个元素 4 字节 (int32_t)
    constexpr std::size_t kElementSize = sizeof(std::int32_t);

    // 每次分配的固定簿记开销 (24 字节)，折算成元素个数
    constexpr std::int64_t kOverheadElements = 6;

    constexpr std::int64_t kBytesPerMB = 1048576;
    constexpr std::int64_t kElementsPerMB = kBytesPerMB / static_cast<std::int64_t>(kElementSize);

    // 单次连续分配允许的最大元素个数 (0x7FEFFFFF)
    constexpr std::int64_t kMaxElementsPerAllocation = 0x7FEFFFFF;

    // 由上面的常量推导出的最大块大小: ElementsPerBlock(kMaxBlockSizeMB) <= kMaxElementsPerAllocation
    constexpr int kMaxBlockSizeMB =
        static_cast<int>((kMaxElementsPerAllocation + kOverheadElements) / kElementsPerMB);

    static_assert(kMaxBlockSizeMB == 8188, "block size ceiling drifted");

    // 一页 4096 字节 = 1024 个元素
    constexpr std::size_t kTouchStride = 1024;

    // touch 时写入的值
    constexpr std::int32_t kTouchSentinel = 0x5A5A5A5A;

    /**
     * @brief 块大小是否在 [1, kMaxBlockSizeMB] 内
     */
    bool IsValidBlockSize(long long block_size_mb);

    /**
     * @brief 将块大小 (MB) 换算成 int32_t 元素个数
     *
     * elements = block_size_mb * 1MB / 4 - kOverheadElements
     * 扣除簿记开销后，整个缓冲区的实际占用正好等于请求的大小。
     * 调用方需先用 IsValidBlockSize 校验。
     */
    std::int64_t ElementsPerBlock(int block_size_mb);

    /**
     * @brief 达到提交上限所需的块数 (向上取整)
     * @return 0 表示无上限 (max_commit_mb == 0)
     */
    std::int64_t TargetBlockCount(long long max_commit_mb, int block_size_mb);

    /**
     * @brief touch 一个块时会写入的位置个数: ceil(elements * ratio / 1024)
     */
    std::size_t TouchedPositions(std::size_t elements, double fill_ratio);

    /**
     * @brief 每隔 kTouchStride 个元素写一次，直到 elements * fill_ratio
     * @return 实际写入的位置个数
     */
    std::size_t TouchBlock(std::int32_t* data, std::size_t elements, double fill_ratio);

} // namespace alloc_mem

#endif // ALLOC_MEM_BLOCK_SIZER_H
