#include "ScanReport.h"

namespace sock_scan {

const char* warn_code_name(WarnCode code) {
    switch (code) {
        case WarnCode::KernelVersionUnavailable: return "kernel_version_unavailable";
        case WarnCode::NamespaceUnreadable: return "namespace_unreadable";
        case WarnCode::ConnectionTableUnreadable: return "connection_table_unreadable";
        case WarnCode::FdDirUnreadable: return "fd_dir_unreadable";
        case WarnCode::WalkStopped: return "walk_stopped";
    }
    return "unknown";
}

void ScanReport::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    start_time_ = std::chrono::system_clock::now();
    end_time_ = {};
    warnings_.clear();
    counters_ = ScanCounters{};
}

void ScanReport::finish() {
    std::lock_guard<std::mutex> lock(mutex_);
    end_time_ = std::chrono::system_clock::now();
}

void ScanReport::add_warning(WarnCode code, const std::string& detail) {
    std::lock_guard<std::mutex> lock(mutex_);
    warnings_.push_back(ScanWarning{code, detail});
}

void ScanReport::update(const ScanCounters& delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_.processes += delta.processes;
    counters_.processes_skipped += delta.processes_skipped;
    counters_.namespaces += delta.namespaces;
    counters_.empty_namespaces += delta.empty_namespaces;
    counters_.table_reads += delta.table_reads;
    counters_.descriptors += delta.descriptors;
    counters_.socket_descriptors += delta.socket_descriptors;
    counters_.pauses += delta.pauses;
    counters_.sockets += delta.sockets;
}

void ScanReport::set_sockets(size_t sockets) {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_.sockets = sockets;
}

void ScanReport::set_namespaces(size_t namespaces, size_t processes, size_t skipped) {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_.namespaces = namespaces;
    counters_.processes = processes;
    counters_.processes_skipped = skipped;
}

std::vector<ScanWarning> ScanReport::warnings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return warnings_;
}

ScanCounters ScanReport::counters() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return counters_;
}

std::chrono::system_clock::time_point ScanReport::start_time() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return start_time_;
}

std::chrono::system_clock::time_point ScanReport::end_time() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return end_time_;
}

}
