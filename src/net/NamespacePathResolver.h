#pragma once
#include "KernelVersion.h"
#include <functional>
#include <optional>
#include <string>

namespace sock_scan {

// Picks the per-process path whose inode identifies the network namespace.
// Since Linux 3.8 that is /proc/<pid>/ns/net. Older kernels have no ns/
// directory; any file under /proc/<pid>/net/ is per-namespace there, so the
// inode of net/dev serves (undocumented, not guaranteed on newer kernels).
class NamespacePathResolver {
public:
    using VersionProbe = std::function<bool(KernelVersion&, std::string&)>;

    static constexpr const char* kModernSuffix = "ns/net";
    static constexpr const char* kLegacySuffix = "net/dev";

    explicit NamespacePathResolver(VersionProbe probe = probe_kernel_version);

    // Runs the probe on first call only.
    const std::string& suffix();

    // Inspection only; suffix() resolves on demand.
    bool resolved() const { return suffix_.has_value(); }
    bool fallback_used() const { return fallback_used_; }
    const std::string& fallback_reason() const { return fallback_reason_; }

private:
    VersionProbe probe_;
    std::optional<std::string> suffix_;
    bool fallback_used_ = false;
    std::string fallback_reason_;
};

}
