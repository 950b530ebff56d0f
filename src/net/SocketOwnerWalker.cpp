#include "SocketOwnerWalker.h"
#include "../core/Logging.h"
#include <cstring>
#include <memory>
#include <utility>

namespace sock_scan {

SocketOwnerWalker::SocketOwnerWalker(const ProcFilesystem& fs, std::string proc_root,
                                     const ConnectionTableReader& reader)
    : fs_(fs), proc_root_(std::move(proc_root)), reader_(reader) {}

WalkResult SocketOwnerWalker::walk(const std::vector<ProcessHandle>& group, std::string& buffer, TickSource& ticks,
                                   size_t fd_block_size) const {
    WalkResult result;
    size_t block_count = 0;
    std::vector<std::string> fds;
    std::string fd_path;
    FileStat st;

    for (size_t i = 0; i < group.size(); ++i) {
        const auto& p = group[i];
        std::string fd_base = proc_path(proc_root_, p.pid, "fd");

        if (int err = fs_.list_dir(fd_base, fds); err != 0) {
            // Process is gone by now, or we don't have access.
            ++result.processes_unreadable;
            if (Logger::instance().enabled(LogLevel::Trace)) {
                Logger::instance().trace("walk: skip pid " + std::to_string(p.pid) + ": " + strerror(err));
            }
            continue;
        }

        SocketOwnerPtr owner;
        for (const auto& fd : fds) {
            if (fd_block_size > 0 && block_count >= fd_block_size) {
                ticks.wait();
                ++result.pauses;
                block_count = 0;

                ConnectionReadResult reread = reader_.read(buffer, group, i);
                ++result.rereads;
                if (!reread.ok() || !reread.found) {
                    result.stopped_early = true;
                    result.stop_error = reread.error;
                    Logger::instance().debug("walk: connection tables " +
                                             std::string(reread.ok() ? "now empty" : "unreadable") +
                                             " after pause, stopping at pid " + std::to_string(p.pid));
                    return result;
                }
            }
            ++block_count;
            ++result.descriptors;

            fd_path.assign(fd_base).append(1, '/').append(fd);
            if (fs_.stat_path(fd_path, st) != 0) continue;
            if (!st.is_socket()) continue;

            ++result.socket_descriptors;
            if (!owner) {
                owner = std::make_shared<const SocketOwner>(SocketOwner{p.pid, p.name});
            }
            result.sockets[st.inode] = owner;
        }
    }

    return result;
}

}
