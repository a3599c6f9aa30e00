#include "block_sizer.h"

#include <cmath>

namespace alloc_mem {

bool IsValidBlockSize(long long block_size_mb) {
    return block_size_mb >= 1 && block_size_mb <= kMaxBlockSizeMB;
}

std::int64_t ElementsPerBlock(int block_size_mb) {
    // 先转 64 位再乘，8188 * 1MB 会溢出 int
    return static_cast<std::int64_t>(block_size_mb) * kBytesPerMB
           / static_cast<std::int64_t>(kElementSize) - kOverheadElements;
}

std::int64_t TargetBlockCount(long long max_commit_mb, int block_size_mb) {
    if (max_commit_mb <= 0 || block_size_mb <= 0) {
        return 0;
    }
    // 不能整除时多分配一块，允许略超上限而不是不足
    // 先除后补，max_commit_mb 接近 LLONG_MAX 时也不会溢出
    return max_commit_mb / block_size_mb + (max_commit_mb % block_size_mb != 0 ? 1 : 0);
}

std::size_t TouchedPositions(std::size_t elements, double fill_ratio) {
    if (fill_ratio <= 0.0 || elements == 0) {
        return 0;
    }
    double limit = static_cast<double>(elements) * fill_ratio;
    return static_cast<std::size_t>(std::ceil(limit / static_cast<double>(kTouchStride)));
}

std::size_t TouchBlock(std::int32_t* data, std::size_t elements, double fill_ratio) {
    if (data == nullptr) {
        return 0;
    }
    // volatile: 写入后不再读取，防止被编译器优化掉
    volatile std::int32_t* p = data;
    double limit = static_cast<double>(elements) * fill_ratio;
    std::size_t touched = 0;
    for (std::size_t i = 0; static_cast<double>(i) < limit && i < elements; i += kTouchStride) {
        p[i] = kTouchSentinel;
        ++touched;
    }
    return touched;
}

} // namespace alloc_mem
