#include "SocketScanner.h"
#include "ScanError.h"
#include "../core/Logging.h"
#include "../core/Metrics.h"
#include "../core/ScanReport.h"
#include <cstring>
#include <utility>

namespace sock_scan {

SocketScanner::SocketScanner(const ProcFilesystem& fs, std::string proc_root, MetricsSink& metrics,
                             NamespacePathResolver::VersionProbe probe)
    : fs_(fs),
      proc_root_(std::move(proc_root)),
      metrics_(metrics),
      resolver_(std::move(probe)),
      grouper_(fs_, proc_root_),
      reader_(fs_, proc_root_),
      walker_(fs_, proc_root_, reader_) {}

SocketOwnerMap SocketScanner::scan(const std::vector<ProcessHandle>& processes, TickSource& ticks,
                                   size_t fd_block_size, ScanReport* report) {
    auto& log = Logger::instance();
    if (report) report->start();

    FileStat root_st;
    if (int err = fs_.stat_path(proc_root_, root_st); err != 0) {
        throw ScanError("proc root " + proc_root_ + " unreachable: " + strerror(err), err);
    }

    const std::string& suffix = resolver_.suffix();
    if (report && resolver_.fallback_used()) {
        report->add_warning(WarnCode::KernelVersionUnavailable, resolver_.fallback_reason());
    }

    // Two passes: group by namespace first so that each namespace's tables
    // are read right before its members' descriptors, keeping the window
    // between the two as short as possible.
    size_t skipped = 0;
    NamespaceGroups groups = grouper_.group(processes, suffix, &skipped);
    if (report) {
        report->set_namespaces(groups.size(), processes.size(), skipped);
        if (skipped > 0) {
            report->add_warning(WarnCode::NamespaceUnreadable,
                                std::to_string(skipped) + " of " + std::to_string(processes.size()) +
                                " processes without readable " + suffix);
        }
    }
    log.debug("scan: " + std::to_string(processes.size()) + " processes in " + std::to_string(groups.size()) +
              " namespaces");

    SocketOwnerMap sockets;
    std::string buffer;
    for (const auto& kv : groups) {
        const auto& members = kv.second;
        ticks.wait();

        ScanCounters delta;
        ConnectionReadResult conns = reader_.read(buffer, members);
        ++delta.table_reads;
        if (!conns.ok()) {
            log.warn("scan: namespace " + std::to_string(kv.first) + ": " + conns.error_path + ": " +
                     strerror(conns.error));
            if (report) {
                report->add_warning(WarnCode::ConnectionTableUnreadable,
                                    "namespace " + std::to_string(kv.first) + ": " + conns.error_path + ": " +
                                    strerror(conns.error));
                report->update(delta);
            }
            continue;
        }
        if (!conns.found) {
            ++delta.empty_namespaces;
            if (report) report->update(delta);
            continue;
        }

        WalkResult walked = walker_.walk(members, buffer, ticks, fd_block_size);
        for (auto& entry : walked.sockets) {
            sockets[entry.first] = std::move(entry.second);
        }

        delta.table_reads += walked.rereads;
        delta.descriptors = walked.descriptors;
        delta.socket_descriptors = walked.socket_descriptors;
        delta.pauses = walked.pauses;
        if (report) {
            report->update(delta);
            if (walked.processes_unreadable > 0) {
                report->add_warning(WarnCode::FdDirUnreadable,
                                    "namespace " + std::to_string(kv.first) + ": " +
                                    std::to_string(walked.processes_unreadable) + " fd directories unreadable");
            }
            if (walked.stopped_early) {
                report->add_warning(WarnCode::WalkStopped,
                                    "namespace " + std::to_string(kv.first) + ": " +
                                    (walked.stop_error ? strerror(walked.stop_error) : "connections gone") +
                                    " after rate-limit pause");
            }
        }
    }
    buffer.clear();

    metrics_.set_gauge(kNamespaceGauge, static_cast<double>(groups.size()));
    if (report) {
        report->set_sockets(sockets.size());
        report->finish();
    }
    log.debug("scan: attributed " + std::to_string(sockets.size()) + " sockets");
    return sockets;
}

}
