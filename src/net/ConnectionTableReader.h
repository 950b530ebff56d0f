#pragma once
#include "Process.h"
#include "ProcFilesystem.h"
#include <string>
#include <vector>

namespace sock_scan {

struct ConnectionReadResult {
    bool found = false; // some member's tcp + tcp6 read returned bytes
    int error = 0; // errno of the last failed read when no member succeeded
    std::string error_path;

    bool ok() const { return error == 0; }
};

// Reads net/tcp and net/tcp6 for a namespace group. Every member of a group
// sees the same tables, so the first member whose reads both succeed answers
// for the whole group; the others are only tried when an earlier one fails
// (typically because it exited).
class ConnectionTableReader {
public:
    ConnectionTableReader(const ProcFilesystem& fs, std::string proc_root);

    // Tries group[first..]. buffer is cleared before each member's attempt
    // and holds the winning member's tcp followed by tcp6 contents.
    ConnectionReadResult read(std::string& buffer, const std::vector<ProcessHandle>& group, size_t first = 0) const;

private:
    const ProcFilesystem& fs_;
    std::string proc_root_;
};

}
