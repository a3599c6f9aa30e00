#include <filesystem>
#include <fstream>
#include <string>

#include "../src/core/alloc/memory_stats.h"
#include "test_harness.h"

using namespace alloc_mem;
using alloc_mem_test::RunTest;
namespace fs = std::filesystem;

namespace {

    const char* kStatus =
        "Name:\talloc_mem\n"
        "VmPeak:\t  120000 kB\n"
        "VmSize:\t  110000 kB\n"
        "VmHWM:\t   60000 kB\n"
        "VmRSS:\t   50000 kB\n"
        "RssAnon:\t   48000 kB\n"
        "RssFile:\t    2000 kB\n";

    void WriteFile(const fs::path& path, const std::string& content) {
        fs::create_directories(path.parent_path());
        std::ofstream(path) << content;
    }

} // anonymous namespace

int main() {
    std::cout << "=== Memory Stats Test ===" << std::endl;

    RunTest("parse_proc_status", []() -> std::string {
        MemoryStats stats;
        EXPECT(ProcMemoryStats::ParseProcStatus(kStatus, stats));
        EXPECT_EQ(stats.vm_size_kb, 110000u);
        EXPECT_EQ(stats.vm_rss_kb, 50000u);
        EXPECT_EQ(stats.rss_anon_kb, 48000u);
        EXPECT_EQ(stats.vm_hwm_kb, 60000u);

        MemoryStats empty;
        EXPECT(!ProcMemoryStats::ParseProcStatus("Name:\tx\n", empty));
        return "";
    });

    RunTest("parse_cgroup_path", []() -> std::string {
        EXPECT_EQ(ProcMemoryStats::ParseCgroupPath("0::/docker/abc\n"), std::string("/docker/abc"));
        EXPECT_EQ(ProcMemoryStats::ParseCgroupPath("0::/\n"), std::string("/"));
        // cgroup v1 没有 "0::" 行
        EXPECT_EQ(ProcMemoryStats::ParseCgroupPath("4:memory:/user\n2:cpu:/user\n"), std::string(""));
        return "";
    });

    RunTest("snapshot_from_fake_roots", []() -> std::string {
        fs::path root = fs::temp_directory_path() / "alloc_mem_stats_test";
        std::error_code ec;
        fs::remove_all(root, ec);
        WriteFile(root / "proc/self/status", kStatus);
        WriteFile(root / "proc/self/cgroup", "0::/box\n");
        WriteFile(root / "cgroup/box/memory.current", "268435456\n");
        WriteFile(root / "cgroup/box/memory.max", "536870912\n");

        ProcMemoryStats provider((root / "proc").string(), (root / "cgroup").string());
        MemoryStats stats;
        bool ok = provider.Snapshot(stats);

        // memory.max 为 "max" 时视为无限制
        WriteFile(root / "cgroup/box/memory.max", "max\n");
        MemoryStats unlimited;
        bool ok2 = provider.Snapshot(unlimited);
        fs::remove_all(root, ec);

        EXPECT(ok);
        EXPECT_EQ(stats.vm_rss_kb, 50000u);
        EXPECT(stats.has_cgroup);
        EXPECT_EQ(stats.cgroup_current_bytes, 268435456u);
        EXPECT_EQ(stats.cgroup_max_bytes, 536870912u);
        EXPECT(stats.minor_faults > 0);

        EXPECT(ok2);
        EXPECT(unlimited.has_cgroup);
        EXPECT_EQ(unlimited.cgroup_max_bytes, 0u);
        return "";
    });

    RunTest("snapshot_missing_sources", []() -> std::string {
        ProcMemoryStats provider("/nonexistent/proc", "/nonexistent/cgroup");
        MemoryStats stats;
        EXPECT(provider.Snapshot(stats));
        EXPECT_EQ(stats.vm_rss_kb, 0u);
        EXPECT(!stats.has_cgroup);
        // 没有 procfs 时退回 ru_maxrss
        EXPECT(stats.vm_hwm_kb > 0);
        return "";
    });

    return alloc_mem_test::Summary("Memory Stats Test");
}
