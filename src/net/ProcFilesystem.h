#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <sys/types.h>
#include <sys/stat.h>

namespace sock_scan {

struct FileStat {
    uint64_t inode = 0;
    uint32_t mode = 0;
    bool is_socket() const { return (mode & S_IFMT) == S_IFSOCK; }
};

// Filesystem primitives the engine needs. Errors are reported as positive
// errno values; 0 means success.
class ProcFilesystem {
public:
    virtual ~ProcFilesystem() = default;
    // Appends the whole file to buffer. Returns bytes appended, or -errno.
    virtual ssize_t read_file(const std::string& path, std::string& buffer) const = 0;
    // stat(2): follows symlinks, so /proc/<pid>/fd/<n> yields the target inode.
    virtual int stat_path(const std::string& path, FileStat& out) const = 0;
    // Entry names without "." and "..".
    virtual int list_dir(const std::string& path, std::vector<std::string>& names) const = 0;
};

class LinuxProcFilesystem : public ProcFilesystem {
public:
    ssize_t read_file(const std::string& path, std::string& buffer) const override;
    int stat_path(const std::string& path, FileStat& out) const override;
    int list_dir(const std::string& path, std::vector<std::string>& names) const override;
};

// <root>/<pid>/<rel>
std::string proc_path(const std::string& root, int pid, const std::string& rel);

}
