#pragma once
#include <string>

namespace sock_scan {

struct KernelVersion {
    int major = 0;
    int minor = 0;
    int patch = 0;

    std::string to_string() const;
};

bool operator<(const KernelVersion& a, const KernelVersion& b);
bool operator==(const KernelVersion& a, const KernelVersion& b);

// Parses the leading dotted numeric part of a release string
// ("5.15.0-91-generic", "3.7", "4.19.0+"). Missing components are zero.
bool parse_kernel_release(const std::string& release, KernelVersion& out);

// uname(2) release of the running kernel.
bool probe_kernel_version(KernelVersion& out, std::string& err);

}
