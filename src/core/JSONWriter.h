#pragma once
#include "../net/Process.h"
#include <string>

namespace sock_scan {

struct Config;
class ScanReport;
class GaugeRegistry;

class JSONWriter {
public:
    // {meta, summary, sockets[], warnings[], gauges{}}; sockets sorted by inode,
    // object keys sorted.
    std::string write(const SocketOwnerMap& sockets, const ScanReport& report, const GaugeRegistry& gauges,
                      const Config& cfg) const;
};

}
