#include "NamespaceGrouper.h"
#include "../core/Logging.h"
#include <cstring>
#include <utility>

namespace sock_scan {

NamespaceGrouper::NamespaceGrouper(const ProcFilesystem& fs, std::string proc_root)
    : fs_(fs), proc_root_(std::move(proc_root)) {}

NamespaceGroups NamespaceGrouper::group(const std::vector<ProcessHandle>& processes, const std::string& suffix,
                                        size_t* skipped) const {
    NamespaceGroups groups;
    size_t skip_count = 0;
    FileStat st;
    for (const auto& p : processes) {
        std::string marker = proc_path(proc_root_, p.pid, suffix);
        if (int err = fs_.stat_path(marker, st); err != 0) {
            ++skip_count;
            if (Logger::instance().enabled(LogLevel::Trace)) {
                Logger::instance().trace("namespace: skip pid " + std::to_string(p.pid) + ": " + marker + ": " + strerror(err));
            }
            continue;
        }
        groups[st.inode].push_back(p);
    }
    if (skipped) *skipped = skip_count;
    return groups;
}

}
