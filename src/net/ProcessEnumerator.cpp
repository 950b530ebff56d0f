#include "ProcessEnumerator.h"
#include "ScanError.h"
#include "../core/Logging.h"
#include <climits>
#include <cstring>

namespace sock_scan {

bool parse_pid(const std::string& s, int& pid) {
    if (s.empty() || s.size() > 10) return false;
    long val = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        val = val * 10 + (c - '0');
    }
    if (val <= 0 || val > INT_MAX) return false;
    pid = static_cast<int>(val);
    return true;
}

std::vector<ProcessHandle> enumerate_processes(const ProcFilesystem& fs, const std::string& proc_root) {
    std::vector<std::string> entries;
    if (int err = fs.list_dir(proc_root, entries); err != 0) {
        throw ScanError("cannot enumerate processes under " + proc_root + ": " + strerror(err), err);
    }

    std::vector<ProcessHandle> processes;
    processes.reserve(entries.size());
    std::string comm;
    for (const auto& name : entries) {
        int pid;
        if (!parse_pid(name, pid)) continue;

        comm.clear();
        if (fs.read_file(proc_path(proc_root, pid, "comm"), comm) < 0) {
            continue;
        }
        while (!comm.empty() && (comm.back() == '\n' || comm.back() == '\0')) comm.pop_back();
        processes.push_back(ProcessHandle{pid, comm});
    }
    Logger::instance().debug("enumerated " + std::to_string(processes.size()) + " processes under " + proc_root);
    return processes;
}

}
