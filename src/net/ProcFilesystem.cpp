#include "ProcFilesystem.h"
#include <cerrno>
#include <dirent.h>
#include <fcntl.h>
#include <unistd.h>

namespace sock_scan {

std::string proc_path(const std::string& root, int pid, const std::string& rel) {
    std::string out;
    out.reserve(root.size() + rel.size() + 16);
    out += root;
    out += '/';
    out += std::to_string(pid);
    out += '/';
    out += rel;
    return out;
}

ssize_t LinuxProcFilesystem::read_file(const std::string& path, std::string& buffer) const {
    int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd == -1) return -errno;

    // procfs reports st_size 0 for generated files, so read until EOF.
    char chunk[8192];
    ssize_t total_read = 0;
    for (;;) {
        ssize_t bytes_read;
        do {
            bytes_read = read(fd, chunk, sizeof(chunk));
        } while (bytes_read == -1 && errno == EINTR);

        if (bytes_read == 0) break;
        if (bytes_read < 0) {
            int err = errno;
            close(fd);
            return -err;
        }
        buffer.append(chunk, static_cast<size_t>(bytes_read));
        total_read += bytes_read;
    }
    close(fd);
    return total_read;
}

int LinuxProcFilesystem::stat_path(const std::string& path, FileStat& out) const {
    struct stat st{};
    if (stat(path.c_str(), &st) != 0) return errno;
    out.inode = static_cast<uint64_t>(st.st_ino);
    out.mode = static_cast<uint32_t>(st.st_mode);
    return 0;
}

int LinuxProcFilesystem::list_dir(const std::string& path, std::vector<std::string>& names) const {
    DIR* dir = opendir(path.c_str());
    if (!dir) return errno;

    names.clear();
    int err = 0;
    for (;;) {
        errno = 0;
        struct dirent* entry = readdir(dir);
        if (!entry) {
            err = errno;
            break;
        }
        if (entry->d_name[0] == '.' &&
            (entry->d_name[1] == '\0' || (entry->d_name[1] == '.' && entry->d_name[2] == '\0'))) {
            continue;
        }
        names.emplace_back(entry->d_name);
    }
    closedir(dir);
    return err;
}

}
