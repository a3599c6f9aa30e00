#include "memory_stats.h"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include <sys/resource.h>
#include <sys/time.h>

namespace alloc_mem {

namespace {

    // "VmRSS:     1234 kB" -> 1234
    bool ParseKbField(const std::string& line, const std::string& key, uint64_t& out) {
        if (line.compare(0, key.size(), key) != 0) {
            return false;
        }
        std::istringstream iss(line.substr(key.size()));
        uint64_t value = 0;
        if (!(iss >> value)) {
            return false;
        }
        out = value;
        return true;
    }

    bool ParseUint(const std::string& s, uint64_t& out) {
        try {
            std::size_t pos = 0;
            out = std::stoull(s, &pos);
            return pos > 0;
        } catch (const std::invalid_argument&) {
            return false;
        } catch (const std::out_of_range&) {
            return false;
        }
    }

} // anonymous namespace

ProcMemoryStats::ProcMemoryStats(const std::string& proc_root, const std::string& cgroup_root)
    : proc_root_(proc_root)
    , cgroup_root_(cgroup_root)
{
}

bool ProcMemoryStats::Snapshot(MemoryStats& stats) {
    stats = MemoryStats{};

    std::string status = ReadFromFile(proc_root_ + "/self/status", true);
    bool have_status = !status.empty() && ParseProcStatus(status, stats);

    struct rusage usage {};
    if (getrusage(RUSAGE_SELF, &usage) == 0) {
        stats.minor_faults = static_cast<uint64_t>(usage.ru_minflt);
        stats.major_faults = static_cast<uint64_t>(usage.ru_majflt);
        if (!have_status) {
            // 没有 procfs 时至少给出峰值 (ru_maxrss 单位为 KB)
            stats.vm_hwm_kb = static_cast<uint64_t>(usage.ru_maxrss);
        }
    }

    ReadCgroup(stats);
    return true;
}

bool ProcMemoryStats::ParseProcStatus(const std::string& content, MemoryStats& stats) {
    std::istringstream iss(content);
    std::string line;
    bool have_rss = false;
    while (std::getline(iss, line)) {
        if (ParseKbField(line, "VmRSS:", stats.vm_rss_kb)) {
            have_rss = true;
            continue;
        }
        if (ParseKbField(line, "VmSize:", stats.vm_size_kb)) continue;
        if (ParseKbField(line, "RssAnon:", stats.rss_anon_kb)) continue;
        ParseKbField(line, "VmHWM:", stats.vm_hwm_kb);
    }
    return have_rss;
}

std::string ProcMemoryStats::ParseCgroupPath(const std::string& content) {
    // cgroup v2 只有一行: "0::/user.slice/..."
    std::istringstream iss(content);
    std::string line;
    while (std::getline(iss, line)) {
        if (line.compare(0, 3, "0::") == 0) {
            return line.substr(3);
        }
    }
    return "";
}

void ProcMemoryStats::ReadCgroup(MemoryStats& stats) const {
    std::string rel = ParseCgroupPath(ReadFromFile(proc_root_ + "/self/cgroup", true));
    if (rel.empty()) {
        return;
    }
    if (rel == "/") {
        rel.clear();
    }
    std::string dir = cgroup_root_ + rel;

    uint64_t current = 0;
    if (!ParseUint(ReadFromFile(dir + "/memory.current", false), current)) {
        return;
    }
    stats.has_cgroup = true;
    stats.cgroup_current_bytes = current;

    // memory.max 为 "max" 时视为无限制
    uint64_t limit = 0;
    if (ParseUint(ReadFromFile(dir + "/memory.max", false), limit)) {
        stats.cgroup_max_bytes = limit;
    }
}

std::string ProcMemoryStats::ReadFromFile(const std::string& path, bool whole_file) {
    std::ifstream ifs(path);
    if (!ifs) {
        return "";
    }
    if (whole_file) {
        std::stringstream buffer;
        buffer << ifs.rdbuf();
        return buffer.str();
    }
    std::string content;
    std::getline(ifs, content);
    return content;
}

} // namespace alloc_mem
