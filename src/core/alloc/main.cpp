/**
 * @file main.cpp (alloc_mem)
 * @brief 可控内存压力生成器 (CLI)
 *
 * 约束:
 * 1. stdout 只输出进度 (文本或 JSON Lines)
 * 2. debug/log 仅输出到 stderr
 * 3. 收到 SIGINT/SIGTERM 后走正常 return 路径退出
 */
#include <cstdlib>
#include <exception>
#include <getopt.h>
#include <iostream>
#include <string>
#include <unistd.h>

#include "alloc_internal.h"
#include "alloc_loop.h"
#include "block_sizer.h"
#include "memory_stats.h"
#include "progress_reporter.h"
#include "shutdown_signal.h"

namespace {

// 命令行给出的原始值，最后再覆盖配置文件和环境变量
struct CliArgs {
    std::string config_path;
    std::string block_size;
    std::string fill_ratio;
    std::string max_commit;
    std::string delay;
    std::string stats_interval;
    bool break_after_start = false;
    bool json = false;
};

bool ParseInt(const std::string& raw, long long& out) {
    try {
        std::size_t pos = 0;
        out = std::stoll(raw, &pos);
        return pos == raw.size();
    } catch (const std::exception&) {
        return false;
    }
}

bool ParseDouble(const std::string& raw, double& out) {
    try {
        std::size_t pos = 0;
        out = std::stod(raw, &pos);
        return pos == raw.size();
    } catch (const std::exception&) {
        return false;
    }
}

// int 范围外的值统一压成越界值，交给 ValidateOptions 报错
int ClampToInt(long long v) {
    if (v > 0x7FFFFFFFLL) return 0x7FFFFFFF;
    if (v < -0x7FFFFFFFLL) return -0x7FFFFFFF;
    return static_cast<int>(v);
}

bool ApplyCliArgs(const CliArgs& cli, alloc_mem::AllocOptions& opts, std::string& err) {
    long long value = 0;
    if (!cli.block_size.empty()) {
        if (!ParseInt(cli.block_size, value)) {
            err = "invalid block size: " + cli.block_size;
            return false;
        }
        opts.block_size_mb = ClampToInt(value);
    }
    if (!cli.fill_ratio.empty()) {
        if (!ParseDouble(cli.fill_ratio, opts.touch_fill_ratio)) {
            err = "invalid touch fill ratio: " + cli.fill_ratio;
            return false;
        }
    }
    if (!cli.max_commit.empty()) {
        if (!ParseInt(cli.max_commit, value)) {
            err = "invalid max commit: " + cli.max_commit;
            return false;
        }
        opts.max_commit_mb = value;
        opts.has_max_commit = true;
    }
    if (!cli.delay.empty()) {
        if (!ParseInt(cli.delay, value)) {
            err = "invalid delay: " + cli.delay;
            return false;
        }
        opts.delay_ms = ClampToInt(value);
    }
    if (!cli.stats_interval.empty()) {
        if (!ParseInt(cli.stats_interval, value)) {
            err = "invalid stats interval: " + cli.stats_interval;
            return false;
        }
        opts.stats_interval = ClampToInt(value);
    }
    if (cli.break_after_start) {
        opts.break_after_start = true;
    }
    if (cli.json) {
        opts.json_output = true;
    }
    return true;
}

// 分配前暂停，便于记录基线内存。stdin 关闭 (容器中常见) 时直接继续
void WaitForConfirmation(alloc_mem::MemoryStatsProvider& stats, alloc_mem::ProgressReporter& reporter) {
    std::cerr << "[CLI] PID " << getpid() << " paused before allocating. Press Enter to continue" << std::endl;
    alloc_mem::MemoryStats baseline;
    if (stats.Snapshot(baseline)) {
        reporter.Stats(baseline, "baseline");
    }
    std::string line;
    if (!std::getline(std::cin, line)) {
        std::cerr << "[CLI] stdin closed, continuing" << std::endl;
    }
}

void PrintUsage(const char* prog) {
    std::cerr << "Usage: " << prog << " -x <MB> [options]\n"
              << "Options:\n"
              << "  -m, --block-size <MB>        Size of individual memory blocks (default: 1, max: "
              << alloc_mem::kMaxBlockSizeMB << ")\n"
              << "  -f, --fill-ratio <ratio>     Fraction of each block to touch, 0..1 (default: 1)\n"
              << "  -x, --max-commit <MB>        Stop once this much is committed (required, 0 = until exhausted)\n"
              << "  -e, --delay <ms>             Time between allocations (default: 0)\n"
              << "  -b, --break-after-start      Pause for Enter before allocating\n"
              << "  -s, --stats-interval <n>     Print process memory stats every n blocks (default: 10, 0 = off)\n"
              << "  -C, --config <path>          YAML config file\n"
              << "      --json                   Emit JSON lines instead of text\n"
              << "  -h, --help                   Show this help\n"
              << "Environment: ALLOC_MEM_BLOCK_MB, ALLOC_MEM_FILL_RATIO, ALLOC_MEM_MAX_COMMIT_MB, ALLOC_MEM_DELAY_MS\n";
}

}  // namespace

int main(int argc, char** argv) {
    CliArgs cli;
    int opt;
    static struct option long_opts[] = {
        {"block-size", required_argument, nullptr, 'm'},
        {"fill-ratio", required_argument, nullptr, 'f'},
        {"max-commit", required_argument, nullptr, 'x'},
        {"delay", required_argument, nullptr, 'e'},
        {"break-after-start", no_argument, nullptr, 'b'},
        {"stats-interval", required_argument, nullptr, 's'},
        {"config", required_argument, nullptr, 'C'},
        {"json", no_argument, nullptr, 1},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };
    while ((opt = getopt_long(argc, argv, "m:f:x:e:bs:C:h", long_opts, nullptr)) != -1) {
        switch (opt) {
            case 'm':
                cli.block_size = optarg;
                break;
            case 'f':
                cli.fill_ratio = optarg;
                break;
            case 'x':
                cli.max_commit = optarg;
                break;
            case 'e':
                cli.delay = optarg;
                break;
            case 'b':
                cli.break_after_start = true;
                break;
            case 's':
                cli.stats_interval = optarg;
                break;
            case 'C':
                cli.config_path = optarg;
                break;
            case 1:
                cli.json = true;
                break;
            case 'h':
                PrintUsage(argv[0]);
                return alloc_mem::EXIT_OK;
            default:
                PrintUsage(argv[0]);
                return alloc_mem::ERR_USAGE;
        }
    }

    // 1. 合并配置: 默认值 < 配置文件 < 环境变量 < 命令行
    alloc_mem::AllocOptions opts;
    std::string err;
    if (!cli.config_path.empty() && !alloc_mem::LoadConfig(cli.config_path, opts, err)) {
        std::cerr << "[Config] " << err << std::endl;
        return alloc_mem::ERR_CONFIG;
    }
    if (!alloc_mem::ApplyEnvOverrides(opts, err)) {
        std::cerr << "[Config] " << err << std::endl;
        return alloc_mem::ERR_CONFIG;
    }
    if (!ApplyCliArgs(cli, opts, err)) {
        std::cerr << "[CLI] " << err << std::endl;
        PrintUsage(argv[0]);
        return alloc_mem::ERR_USAGE;
    }

    alloc_mem::ProgressReporter reporter(std::cout, opts.json_output);

    // 2. 校验，失败时不分配任何内存
    if (!alloc_mem::ValidateOptions(opts, err)) {
        std::cerr << "[Config] " << err << std::endl;
        reporter.ConfigError(err);
        return alloc_mem::ERR_CONFIG;
    }

    // 3. 信号监听必须在其它线程创建之前启动
    alloc_mem::ShutdownSignal shutdown;
    alloc_mem::SignalWatcher watcher(shutdown);
    if (!watcher.Start(err)) {
        std::cerr << "[Signal] " << err << std::endl;
        return alloc_mem::ERR_SIGNAL_SETUP;
    }

    alloc_mem::ProcMemoryStats stats;
    if (opts.break_after_start) {
        WaitForConfirmation(stats, reporter);
    }

    // 4. 分配并持有内存，直到收到关闭信号
    alloc_mem::AllocationLoop loop(opts, shutdown, &stats, reporter);
    if (loop.Run() == alloc_mem::LoopStatus::CONFIG_ERROR) {
        return alloc_mem::ERR_CONFIG;
    }

    std::cerr << "[CLI] Exiting normally with " << loop.BlocksAllocated() << " blocks held" << std::endl;
    return alloc_mem::EXIT_OK;
}
