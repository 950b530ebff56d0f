#include "ArgumentParser.h"
#include "BuildInfo.h"
#include <iostream>
#include <stdexcept>

namespace sock_scan {

ArgumentParser::ArgumentParser() {
    auto int_flag = [this](const char* name, int Config::*field) {
        return [this, name, field](Config& cfg, const std::string& v){ parse_int(v, name, cfg.*field); };
    };
    specs_ = {
        {"--proc-root", ArgKind::String, "Proc filesystem root (default /proc)",
            [this](Config& cfg, const std::string& v){ cfg.proc_root = v; proc_root_given_ = true; }},
        {"--fd-block-size", ArgKind::Int, "Descriptors examined between rate-limit pauses", int_flag("--fd-block-size", &Config::fd_block_size)},
        {"--tick-ms", ArgKind::Int, "Rate-limit tick interval in milliseconds", int_flag("--tick-ms", &Config::tick_interval_ms)},
        {"--scan-timeout", ArgKind::Int, "Abort a scan running longer than N seconds", int_flag("--scan-timeout", &Config::scan_timeout_seconds)},
        {"--interval", ArgKind::Int, "Re-scan every N seconds", int_flag("--interval", &Config::interval_seconds)},
        {"--iterations", ArgKind::Int, "Number of scans with --interval (0 = forever)", int_flag("--iterations", &Config::iterations)},
        {"--output", ArgKind::String, "Write JSON to FILE (default stdout)",
            [](Config& cfg, const std::string& v){ cfg.output_file = v; }},
        {"--metrics-file", ArgKind::String, "Write Prometheus gauges to FILE after each scan",
            [](Config& cfg, const std::string& v){ cfg.metrics_file = v; }},
        {"--pretty", ArgKind::None, "Pretty-print JSON",
            [](Config& cfg, const std::string&){ cfg.pretty = true; }},
        {"--compact", ArgKind::None, "Minified JSON output",
            [](Config& cfg, const std::string&){ cfg.compact = true; }},
        {"--log-level", ArgKind::String, "error|warn|info|debug|trace",
            [this](Config& cfg, const std::string& v){ cfg.log_level = v; log_level_given_ = true; }},
        {"--verbose", ArgKind::None, "Same as --log-level debug",
            [this](Config& cfg, const std::string&){ cfg.log_level = "debug"; log_level_given_ = true; }},
        {"--quiet", ArgKind::None, "Same as --log-level error",
            [this](Config& cfg, const std::string&){ cfg.log_level = "error"; log_level_given_ = true; }},
        {"--drop-priv", ArgKind::None, "Drop all capabilities except those needed to read /proc/<pid>/fd",
            [](Config& cfg, const std::string&){ cfg.drop_priv = true; }},
        {"--seccomp", ArgKind::None, "Apply seccomp profile before scanning",
            [](Config& cfg, const std::string&){ cfg.seccomp = true; }},
        {"--seccomp-strict", ArgKind::None, "Fail if seccomp apply fails",
            [](Config& cfg, const std::string&){ cfg.seccomp_strict = true; }},
    };
}

bool ArgumentParser::parse_int(const std::string& v, const char* flag, int& out) {
    try {
        size_t used = 0;
        int parsed = std::stoi(v, &used);
        if(used != v.size()) throw std::invalid_argument(v);
        out = parsed;
        return true;
    } catch(const std::exception&) {
        std::cerr << "Invalid integer for " << flag << ": " << v << "\n";
        bad_value_ = true;
        return false;
    }
}

const ArgumentParser::FlagSpec* ArgumentParser::find_spec(const std::string& flag) const {
    for(const auto& s : specs_) if(flag == s.name) return &s;
    return nullptr;
}

bool ArgumentParser::parse(int argc, char** argv, Config& cfg) {
    exit_code_ = 0;
    bad_value_ = false;
    for(int i = 1; i < argc; ++i) {
        if(!argv[i]) continue;
        std::string a = argv[i];
        if(a == "--help" || a == "-h") { print_help(); return false; }
        if(a == "--version") {
            std::cout << "sock-scan " << buildinfo::APP_VERSION << " (git=" << buildinfo::GIT_COMMIT
                      << ", compiler=" << buildinfo::COMPILER_ID << " " << buildinfo::COMPILER_VERSION
                      << ", cxx_std=" << buildinfo::CXX_STANDARD << ")\n";
            return false;
        }
        const FlagSpec* spec = find_spec(a);
        if(!spec) {
            std::cerr << "Unknown arg: " << a << "\n";
            exit_code_ = 2;
            return false;
        }
        std::string val;
        if(spec->kind != ArgKind::None) {
            if(i + 1 >= argc || !argv[i + 1]) {
                std::cerr << "Missing value for " << a << "\n";
                exit_code_ = 2;
                return false;
            }
            val = argv[++i];
        }
        spec->apply(cfg, val);
        if(bad_value_) { exit_code_ = 2; return false; }
    }
    return true;
}

void ArgumentParser::print_help() const {
    std::cout << "sock-scan options:\n";
    for(const auto& s : specs_) {
        std::string name = s.name;
        if(s.kind == ArgKind::Int) name += " N";
        else if(s.kind == ArgKind::String) name += " VALUE";
        std::cout << "  " << name;
        if(name.size() < 30) for(size_t i = name.size(); i < 30; ++i) std::cout << ' '; else std::cout << ' ';
        std::cout << s.help << "\n";
    }
    std::cout << "  --version                     Print version & exit\n";
    std::cout << "  --help                        Show this help\n";
}

}
