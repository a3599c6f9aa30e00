#include "progress_reporter.h"

#include <cmath>
#include <iomanip>
#include <sstream>

#include <nlohmann/json.hpp>

#include "shutdown_signal.h"

using json = nlohmann::json;

namespace alloc_mem {

namespace {

    json NewEvent(const char* event) {
        json out;
        out["schema_version"] = 1;
        out["event"] = event;
        return out;
    }

    std::string FormatKB(uint64_t kb) {
        return std::to_string(kb / 1024) + "MB";
    }

} // anonymous namespace

ProgressReporter::ProgressReporter(std::ostream& out, bool json)
    : out_(out)
    , json_(json)
{
}

std::string ProgressReporter::FormatMB(double mb) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << mb;
    std::string s = oss.str();
    s.erase(s.find_last_not_of('0') + 1);
    if (!s.empty() && s.back() == '.') {
        s.pop_back();
    }
    return s;
}

void ProgressReporter::Startup(const AllocPlan& plan) {
    if (json_) {
        json out = NewEvent("start");
        out["target_blocks"] = plan.target_blocks;
        out["unbounded"] = plan.target_blocks == 0;
        out["block_size_mb"] = plan.block_size_mb;
        out["max_commit_mb"] = plan.max_commit_mb;
        out["touch_fill_ratio"] = plan.touch_fill_ratio;
        out["delay_ms"] = plan.delay_ms;
        out["registry_bytes"] = plan.registry_bytes;
        out_ << out.dump() << '\n' << std::flush;
        return;
    }

    if (plan.target_blocks > 0) {
        out_ << "Will allocate " << plan.target_blocks << " blocks of memory each consuming "
             << plan.block_size_mb << " MB, as to hit a limit of " << plan.max_commit_mb << " MB\n";
    } else {
        out_ << "Will allocate blocks of " << plan.block_size_mb
             << " MB indefinitely (no commit limit)\n";
    }
    out_ << "Block registry will consume ~" << plan.registry_bytes << " bytes\n\n" << std::flush;
}

void ProgressReporter::Block(const BlockProgress& p) {
    if (json_) {
        json out = NewEvent("block");
        out["block"] = p.block_no;
        out["block_size_mb"] = p.block_size_mb;
        out["touch_percent"] = std::lround(p.touch_fill_ratio * 100.0);
        out["touched_pages"] = p.touched_pages;
        out["total_allocated_mb"] = p.total_allocated_mb;
        out["total_touched_mb"] = p.total_touched_mb;
        out_ << out.dump() << '\n' << std::flush;
        return;
    }

    out_ << "Block #" << p.block_no << "  +" << p.block_size_mb << "MB (touched "
         << std::lround(p.touch_fill_ratio * 100.0) << "%)  [so far total allocated= "
         << p.total_allocated_mb << "MB / total touched= " << FormatMB(p.total_touched_mb)
         << "MB]\n" << std::flush;
}

void ProgressReporter::Stats(const MemoryStats& s, const std::string& when) {
    if (json_) {
        json out = NewEvent("stats");
        out["when"] = when;
        out["vm_size_kb"] = s.vm_size_kb;
        out["vm_rss_kb"] = s.vm_rss_kb;
        out["rss_anon_kb"] = s.rss_anon_kb;
        out["vm_hwm_kb"] = s.vm_hwm_kb;
        out["minor_faults"] = s.minor_faults;
        out["major_faults"] = s.major_faults;
        if (s.has_cgroup) {
            out["cgroup_current_bytes"] = s.cgroup_current_bytes;
            out["cgroup_max_bytes"] = s.cgroup_max_bytes;
        }
        out_ << out.dump() << '\n' << std::flush;
        return;
    }

    out_ << "[stats " << when << "] VmSize=" << FormatKB(s.vm_size_kb)
         << " VmRSS=" << FormatKB(s.vm_rss_kb)
         << " RssAnon=" << FormatKB(s.rss_anon_kb)
         << " VmHWM=" << FormatKB(s.vm_hwm_kb)
         << " minflt=" << s.minor_faults
         << " majflt=" << s.major_faults;
    if (s.has_cgroup) {
        out_ << " cgroup=" << s.cgroup_current_bytes / (1024 * 1024) << "MB/";
        if (s.cgroup_max_bytes == 0) {
            out_ << "max";
        } else {
            out_ << s.cgroup_max_bytes / (1024 * 1024) << "MB";
        }
    }
    out_ << '\n' << std::flush;
}

void ProgressReporter::Complete(int64_t blocks, long long total_allocated_mb) {
    if (json_) {
        json out = NewEvent("complete");
        out["blocks"] = blocks;
        out["total_allocated_mb"] = total_allocated_mb;
        out_ << out.dump() << '\n' << std::flush;
        return;
    }
    out_ << "Allocating memory complete. Press Ctrl+C to exit\n" << std::flush;
}

void ProgressReporter::Shutdown(int signo, int64_t blocks) {
    if (json_) {
        json out = NewEvent("shutdown");
        out["signal"] = SignalName(signo);
        out["blocks"] = blocks;
        out_ << out.dump() << '\n' << std::flush;
        return;
    }
    out_ << "Shutdown signal received (" << SignalName(signo) << "), holding "
         << blocks << " blocks until exit\n" << std::flush;
}

void ProgressReporter::ConfigError(const std::string& message) {
    if (json_) {
        json out = NewEvent("config_error");
        out["error"] = message;
        out_ << out.dump() << '\n' << std::flush;
        return;
    }
    out_ << message << ". Exiting\n" << std::flush;
}

} // namespace alloc_mem
