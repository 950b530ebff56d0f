#pragma once
#include "ConnectionTableReader.h"
#include "Process.h"
#include "ProcFilesystem.h"
#include "TickSource.h"
#include <cstddef>
#include <string>
#include <vector>

namespace sock_scan {

struct WalkResult {
    SocketOwnerMap sockets;
    size_t descriptors = 0; // fd entries inspected, sockets or not
    size_t socket_descriptors = 0;
    size_t processes_unreadable = 0; // fd directory could not be listed
    size_t pauses = 0;
    size_t rereads = 0;
    bool stopped_early = false; // a post-pause re-read found the group empty or unreadable
    int stop_error = 0;
};

// Maps socket inodes to the processes of one namespace group holding them,
// by stat'ing every /proc/<pid>/fd/<n>.
//
// At most fd_block_size descriptors are inspected between two ticks. After
// each pause the group's connection tables are read again before the walk
// resumes: the tables observed before the pause may no longer describe the
// sockets whose descriptors are about to be inspected. A group whose tables
// come back empty or unreadable is abandoned with what was gathered so far.
class SocketOwnerWalker {
public:
    SocketOwnerWalker(const ProcFilesystem& fs, std::string proc_root, const ConnectionTableReader& reader);
    SocketOwnerWalker(const SocketOwnerWalker&) = delete;
    SocketOwnerWalker& operator=(const SocketOwnerWalker&) = delete;

    // Precondition: reader reported connections for group. fd_block_size 0
    // disables pausing.
    WalkResult walk(const std::vector<ProcessHandle>& group, std::string& buffer, TickSource& ticks,
                    size_t fd_block_size) const;

private:
    const ProcFilesystem& fs_;
    std::string proc_root_;
    const ConnectionTableReader& reader_;
};

}
