#pragma once
#include <string>
#include <vector>

namespace sock_scan {

struct Config {
    std::string proc_root = "/proc"; // overridable for fixtures / containers with host proc mounted elsewhere
    int fd_block_size = 300; // descriptors examined between two rate-limit pauses
    int tick_interval_ms = 10;
    int scan_timeout_seconds = 0; // 0 = no bound on a single scan
    int interval_seconds = 0; // 0 = single shot
    int iterations = 1; // with interval_seconds > 0; 0 = run until killed
    std::string output_file; // empty = stdout
    std::string metrics_file; // Prometheus text format, rewritten after every scan
    bool pretty = false;
    bool compact = false; // if both set, compact wins
    std::string log_level = "info";
    bool drop_priv = false;
    bool seccomp = false;
    bool seccomp_strict = false;
};

}
