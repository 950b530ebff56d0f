#include "NamespacePathResolver.h"
#include "../core/Logging.h"
#include <utility>

namespace sock_scan {

NamespacePathResolver::NamespacePathResolver(VersionProbe probe)
    : probe_(std::move(probe)) {}

const std::string& NamespacePathResolver::suffix() {
    if (suffix_) return *suffix_;

    static const KernelVersion v38{3, 8, 0};
    KernelVersion v;
    std::string err;
    if (!probe_ || !probe_(v, err)) {
        fallback_used_ = true;
        fallback_reason_ = probe_ ? err : "no kernel version probe";
        Logger::instance().error("namespace path: cannot get kernel version (" + fallback_reason_ +
                                 "), assuming a recent kernel");
        suffix_ = kModernSuffix;
        return *suffix_;
    }

    suffix_ = (v < v38) ? kLegacySuffix : kModernSuffix;
    Logger::instance().debug("namespace path: kernel " + v.to_string() + " -> " + *suffix_);
    return *suffix_;
}

}
