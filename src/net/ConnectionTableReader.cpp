#include "ConnectionTableReader.h"
#include "../core/Logging.h"
#include <utility>

namespace sock_scan {

ConnectionTableReader::ConnectionTableReader(const ProcFilesystem& fs, std::string proc_root)
    : fs_(fs), proc_root_(std::move(proc_root)) {}

ConnectionReadResult ConnectionTableReader::read(std::string& buffer, const std::vector<ProcessHandle>& group,
                                                 size_t first) const {
    int err_tcp = 0, err_tcp6 = 0;
    std::string path_tcp, path_tcp6;

    for (size_t i = first; i < group.size(); ++i) {
        const auto& p = group[i];
        buffer.clear();
        path_tcp = proc_path(proc_root_, p.pid, "net/tcp");
        path_tcp6 = proc_path(proc_root_, p.pid, "net/tcp6");

        ssize_t read_tcp = fs_.read_file(path_tcp, buffer);
        ssize_t read_tcp6 = fs_.read_file(path_tcp6, buffer);
        err_tcp = read_tcp < 0 ? static_cast<int>(-read_tcp) : 0;
        err_tcp6 = read_tcp6 < 0 ? static_cast<int>(-read_tcp6) : 0;

        if (err_tcp != 0 || err_tcp6 != 0) {
            if (Logger::instance().enabled(LogLevel::Trace)) {
                Logger::instance().trace("connections: pid " + std::to_string(p.pid) + " unreadable, trying next member");
            }
            continue;
        }
        return ConnectionReadResult{read_tcp + read_tcp6 > 0, 0, {}};
    }

    buffer.clear();
    if (err_tcp != 0) return ConnectionReadResult{false, err_tcp, path_tcp};
    if (err_tcp6 != 0) return ConnectionReadResult{false, err_tcp6, path_tcp6};
    return ConnectionReadResult{};
}

}
