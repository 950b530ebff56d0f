#pragma once
#include "Process.h"
#include "ProcFilesystem.h"
#include <string>
#include <vector>

namespace sock_scan {

// Lists numeric entries of proc_root with their comm name. Processes that
// exit between listing and reading comm are dropped. Throws ScanError when
// proc_root itself cannot be listed.
std::vector<ProcessHandle> enumerate_processes(const ProcFilesystem& fs, const std::string& proc_root);

bool parse_pid(const std::string& s, int& pid);

}
