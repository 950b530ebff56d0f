#pragma once
#include <chrono>
#include <mutex>
#include <string>
#include <vector>
#include <cstddef>

namespace sock_scan {

enum class WarnCode {
    KernelVersionUnavailable,
    NamespaceUnreadable,
    ConnectionTableUnreadable,
    FdDirUnreadable,
    WalkStopped,
};

const char* warn_code_name(WarnCode code);

struct ScanWarning {
    WarnCode code;
    std::string detail;
};

struct ScanCounters {
    size_t processes = 0;
    size_t processes_skipped = 0; // namespace marker not stat-able
    size_t namespaces = 0;
    size_t empty_namespaces = 0; // tables readable but empty, walk skipped
    size_t table_reads = 0; // ConnectionTableReader invocations, re-reads included
    size_t descriptors = 0;
    size_t socket_descriptors = 0;
    size_t pauses = 0; // rate-limit pauses inside walks
    size_t sockets = 0; // distinct inodes in the result
};

// Collection side channel for one scan. Every member is guarded so a report
// may be read from another thread while the scan runs.
class ScanReport {
public:
    void start();
    void finish();

    void add_warning(WarnCode code, const std::string& detail);
    void update(const ScanCounters& delta);
    void set_sockets(size_t sockets);
    void set_namespaces(size_t namespaces, size_t processes, size_t skipped);

    std::vector<ScanWarning> warnings() const;
    ScanCounters counters() const;
    std::chrono::system_clock::time_point start_time() const;
    std::chrono::system_clock::time_point end_time() const;

private:
    std::chrono::system_clock::time_point start_time_{};
    std::chrono::system_clock::time_point end_time_{};
    std::vector<ScanWarning> warnings_;
    ScanCounters counters_;
    mutable std::mutex mutex_;
};

}
