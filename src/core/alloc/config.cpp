// alloc_mem 配置加载: YAML 文件 + 环境变量 + 校验

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <yaml-cpp/yaml.h>

#include "alloc_internal.h"
#include "block_sizer.h"

namespace alloc_mem {

namespace {

    bool ParseEnvInt(const char* name, long long& out, std::string& err) {
        const char* raw = std::getenv(name);
        if (raw == nullptr || raw[0] == '\0') {
            return true;
        }
        try {
            std::size_t pos = 0;
            out = std::stoll(raw, &pos);
            if (raw[pos] != '\0') {
                err = std::string(name) + " is not an integer: " + raw;
                return false;
            }
        } catch (const std::exception&) {
            err = std::string(name) + " is not an integer: " + raw;
            return false;
        }
        return true;
    }

    bool ParseEnvDouble(const char* name, double& out, std::string& err) {
        const char* raw = std::getenv(name);
        if (raw == nullptr || raw[0] == '\0') {
            return true;
        }
        try {
            std::size_t pos = 0;
            out = std::stod(raw, &pos);
            if (raw[pos] != '\0') {
                err = std::string(name) + " is not a number: " + raw;
                return false;
            }
        } catch (const std::exception&) {
            err = std::string(name) + " is not a number: " + raw;
            return false;
        }
        return true;
    }

} // anonymous namespace

bool LoadConfig(const std::string& path, AllocOptions& opts, std::string& err) {
    try {
        std::cerr << "[Config] Loading " << path << " ..." << std::endl;
        YAML::Node config = YAML::LoadFile(path);

        // alloc 段: 分配参数
        if (config["alloc"]) {
            YAML::Node alloc = config["alloc"];
            if (alloc["block_size_mb"]) {
                opts.block_size_mb = alloc["block_size_mb"].as<int>();
            }
            if (alloc["touch_fill_ratio"]) {
                opts.touch_fill_ratio = alloc["touch_fill_ratio"].as<double>();
            }
            if (alloc["delay_ms"]) {
                opts.delay_ms = alloc["delay_ms"].as<int>();
            }
            if (alloc["max_commit_mb"]) {
                opts.max_commit_mb = alloc["max_commit_mb"].as<long long>();
                opts.has_max_commit = true;
            }
            if (alloc["break_after_start"]) {
                opts.break_after_start = alloc["break_after_start"].as<bool>();
            }
        }

        // report 段: 输出参数
        if (config["report"]) {
            YAML::Node report = config["report"];
            if (report["stats_interval_blocks"]) {
                opts.stats_interval = report["stats_interval_blocks"].as<int>();
            }
            if (report["json"]) {
                opts.json_output = report["json"].as<bool>();
            }
        }

        std::cerr << "[Config] Loaded. BlockSize: " << opts.block_size_mb
                  << " MB, MaxCommit: " << (opts.has_max_commit ? std::to_string(opts.max_commit_mb) : "unset")
                  << std::endl;
    } catch (const YAML::Exception& ex) {
        err = std::string("YAML parse failed: ") + ex.what();
        return false;
    }
    return true;
}

bool ApplyEnvOverrides(AllocOptions& opts, std::string& err) {
    long long value = 0;

    if (std::getenv("ALLOC_MEM_BLOCK_MB")) {
        if (!ParseEnvInt("ALLOC_MEM_BLOCK_MB", value, err)) return false;
        if (value < 0 || value > kMaxBlockSizeMB + 1LL) {
            // 越界值保留为非法值交给 ValidateOptions 报告
            value = value < 0 ? -1 : kMaxBlockSizeMB + 1LL;
        }
        opts.block_size_mb = static_cast<int>(value);
    }
    if (std::getenv("ALLOC_MEM_MAX_COMMIT_MB")) {
        if (!ParseEnvInt("ALLOC_MEM_MAX_COMMIT_MB", value, err)) return false;
        opts.max_commit_mb = value;
        opts.has_max_commit = true;
    }
    if (std::getenv("ALLOC_MEM_DELAY_MS")) {
        if (!ParseEnvInt("ALLOC_MEM_DELAY_MS", value, err)) return false;
        if (value < 0 || value > 86400000LL) {
            err = "ALLOC_MEM_DELAY_MS out of range: " + std::to_string(value);
            return false;
        }
        opts.delay_ms = static_cast<int>(value);
    }
    if (!ParseEnvDouble("ALLOC_MEM_FILL_RATIO", opts.touch_fill_ratio, err)) return false;
    return true;
}

bool ValidateOptions(const AllocOptions& opts, std::string& err) {
    if (opts.block_size_mb <= 0) {
        err = "block size must be a positive number of MB";
        return false;
    }
    if (!IsValidBlockSize(opts.block_size_mb)) {
        err = "Input block size too large. Maximum allowed value is "
              + std::to_string(kMaxBlockSizeMB) + " MB";
        return false;
    }
    if (!(opts.touch_fill_ratio >= 0.0 && opts.touch_fill_ratio <= 1.0)) {
        err = "touch fill ratio must be within [0, 1]";
        return false;
    }
    if (opts.delay_ms < 0) {
        err = "delay must not be negative";
        return false;
    }
    if (!opts.has_max_commit) {
        err = "max commit (-x) is required (use 0 to allocate until exhausted)";
        return false;
    }
    if (opts.max_commit_mb < 0) {
        err = "max commit must not be negative";
        return false;
    }
    if (opts.stats_interval < 0) {
        err = "stats interval must not be negative";
        return false;
    }
    return true;
}

} // namespace alloc_mem
