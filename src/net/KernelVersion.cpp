#include "KernelVersion.h"
#include <cctype>
#include <cerrno>
#include <cstring>
#include <climits>
#include <tuple>
#include <sys/utsname.h>

namespace sock_scan {

std::string KernelVersion::to_string() const {
    return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
}

bool operator<(const KernelVersion& a, const KernelVersion& b) {
    return std::tie(a.major, a.minor, a.patch) < std::tie(b.major, b.minor, b.patch);
}

bool operator==(const KernelVersion& a, const KernelVersion& b) {
    return std::tie(a.major, a.minor, a.patch) == std::tie(b.major, b.minor, b.patch);
}

bool parse_kernel_release(const std::string& release, KernelVersion& out) {
    int parts[3] = {0, 0, 0};
    size_t pos = 0;
    int idx = 0;
    while (idx < 3) {
        if (pos >= release.size() || !isdigit(static_cast<unsigned char>(release[pos]))) {
            // "5." or "" are malformed; "5.15-rc1" stops cleanly after a number
            if (idx == 0 || (pos > 0 && release[pos - 1] == '.')) return false;
            break;
        }
        long val = 0;
        while (pos < release.size() && isdigit(static_cast<unsigned char>(release[pos]))) {
            val = val * 10 + (release[pos] - '0');
            if (val > INT_MAX) return false;
            ++pos;
        }
        parts[idx++] = static_cast<int>(val);
        if (pos < release.size() && release[pos] == '.' && idx < 3) {
            ++pos;
            continue;
        }
        break;
    }
    out.major = parts[0];
    out.minor = parts[1];
    out.patch = parts[2];
    return true;
}

bool probe_kernel_version(KernelVersion& out, std::string& err) {
    struct utsname u{};
    if (uname(&u) != 0) {
        err = std::string("uname failed: ") + strerror(errno);
        return false;
    }
    if (!parse_kernel_release(u.release, out)) {
        err = std::string("unparseable kernel release: ") + u.release;
        return false;
    }
    return true;
}

}
