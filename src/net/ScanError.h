#pragma once
#include <stdexcept>
#include <string>

namespace sock_scan {

// The scan cannot proceed at all (proc root unreachable, processes not
// enumerable). Recovery is left to the caller's next scheduled scan.
class ScanError : public std::runtime_error {
public:
    ScanError(const std::string& what, int err) : std::runtime_error(what), errno_(err) {}
    int error_code() const { return errno_; }

private:
    int errno_;
};

}
