#pragma once
#include "Process.h"
#include "ProcFilesystem.h"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace sock_scan {

class ScanReport;

// namespace inode -> members in enumeration order
using NamespaceGroups = std::map<uint64_t, std::vector<ProcessHandle>>;

class NamespaceGrouper {
public:
    NamespaceGrouper(const ProcFilesystem& fs, std::string proc_root);

    // Processes whose namespace marker cannot be stat'ed (exited, EACCES)
    // are left out; skipped counts them.
    NamespaceGroups group(const std::vector<ProcessHandle>& processes, const std::string& suffix,
                          size_t* skipped = nullptr) const;

private:
    const ProcFilesystem& fs_;
    std::string proc_root_;
};

}
