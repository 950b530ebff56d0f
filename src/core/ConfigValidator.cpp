#include "ConfigValidator.h"
#include "Logging.h"
#include <iostream>
#include <cstdlib>

namespace sock_scan {

bool ConfigValidator::validate(Config& cfg) {
    // pretty vs compact: if both set, compact wins (documented behavior)
    if(cfg.pretty && cfg.compact) {
        cfg.pretty = false;
    }

    if(!validate_positive(cfg.fd_block_size, "--fd-block-size")) return false;
    if(!validate_positive(cfg.tick_interval_ms, "--tick-ms")) return false;
    if(!validate_non_negative(cfg.scan_timeout_seconds, "--scan-timeout")) return false;
    if(!validate_non_negative(cfg.interval_seconds, "--interval")) return false;
    if(!validate_non_negative(cfg.iterations, "--iterations")) return false;

    if(cfg.iterations == 0 && cfg.interval_seconds == 0) {
        std::cerr << "--iterations 0 (run forever) requires --interval\n";
        return false;
    }
    if(cfg.interval_seconds == 0 && cfg.iterations > 1) {
        std::cerr << "--iterations > 1 requires --interval\n";
        return false;
    }

    LogLevel level;
    if(!parse_log_level(cfg.log_level, level)) {
        std::cerr << "Invalid --log-level value: " << cfg.log_level << "\n";
        return false;
    }

    if(cfg.proc_root.empty()) {
        std::cerr << "--proc-root must not be empty\n";
        return false;
    }
    // Trailing slashes would double up when joining /<pid>/...
    while(cfg.proc_root.size() > 1 && cfg.proc_root.back() == '/') {
        cfg.proc_root.pop_back();
    }

    if(cfg.seccomp_strict && !cfg.seccomp) {
        cfg.seccomp = true;
    }

    return true;
}

void ConfigValidator::apply_env_overrides(Config& cfg, bool proc_root_from_cli, bool log_level_from_cli) {
    auto get = [](const char* k)->const char*{ const char* v = std::getenv(k); return (v && *v) ? v : nullptr; };
    if(!proc_root_from_cli) {
        if(auto v = get("SOCK_SCAN_PROC_ROOT")) cfg.proc_root = v;
    }
    if(!log_level_from_cli) {
        if(auto v = get("SOCK_SCAN_LOG_LEVEL")) cfg.log_level = v;
    }
}

bool ConfigValidator::validate_positive(int value, const std::string& flag_name) {
    if(value < 1) {
        std::cerr << "Invalid " << flag_name << " value: " << value << " (must be >= 1)\n";
        return false;
    }
    return true;
}

bool ConfigValidator::validate_non_negative(int value, const std::string& flag_name) {
    if(value < 0) {
        std::cerr << "Invalid " << flag_name << " value: " << value << " (must be >= 0)\n";
        return false;
    }
    return true;
}

}
