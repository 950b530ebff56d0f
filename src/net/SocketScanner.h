#pragma once
#include "ConnectionTableReader.h"
#include "NamespaceGrouper.h"
#include "NamespacePathResolver.h"
#include "Process.h"
#include "ProcFilesystem.h"
#include "SocketOwnerWalker.h"
#include "TickSource.h"
#include <string>
#include <vector>

namespace sock_scan {

class MetricsSink;
class ScanReport;

// Attributes open TCP sockets to processes from procfs alone.
//
// A scan groups processes by network namespace, then for each namespace
// reads the connection tables once and walks the members' descriptors. One
// scan runs entirely on the calling thread; concurrent scan() calls on the
// same instance are not supported. The namespace path decision is made on
// the first scan and kept for the lifetime of the scanner.
class SocketScanner {
public:
    static constexpr const char* kNamespaceGauge = "sock_scan.namespaces";

    SocketScanner(const ProcFilesystem& fs, std::string proc_root, MetricsSink& metrics,
                  NamespacePathResolver::VersionProbe probe = probe_kernel_version);
    // walker_ refers to reader_; a copy would point into the original.
    SocketScanner(const SocketScanner&) = delete;
    SocketScanner& operator=(const SocketScanner&) = delete;

    // Throws ScanError when proc_root is unreachable. Exceptions thrown by
    // ticks.wait() propagate unchanged.
    SocketOwnerMap scan(const std::vector<ProcessHandle>& processes, TickSource& ticks, size_t fd_block_size,
                        ScanReport* report = nullptr);

    const std::string& proc_root() const { return proc_root_; }
    NamespacePathResolver& resolver() { return resolver_; }

private:
    const ProcFilesystem& fs_;
    std::string proc_root_;
    MetricsSink& metrics_;
    NamespacePathResolver resolver_;
    NamespaceGrouper grouper_;
    ConnectionTableReader reader_;
    SocketOwnerWalker walker_;
};

}
