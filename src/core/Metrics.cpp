#include "Metrics.h"
#include "Logging.h"
#include <charconv>
#include <cstdio>
#include <fstream>

namespace sock_scan {

namespace {

std::string prometheus_name(const std::string& name) {
    std::string out = name;
    for (auto& c : out) {
        if (c == '.' || c == '-') c = '_';
    }
    return out;
}

void append_double(std::string& out, double v) {
    char buf[32];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
    if (ec == std::errc{}) {
        out.append(buf, ptr);
    } else {
        out += '0';
    }
}

}

void GaugeRegistry::set_gauge(const std::string& name, double value) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[name] = value;
    }
    if (Logger::instance().enabled(LogLevel::Debug)) {
        std::string msg = "gauge " + name + "=";
        append_double(msg, value);
        Logger::instance().debug(msg);
    }
}

bool GaugeRegistry::get(const std::string& name, double& value) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = gauges_.find(name);
    if (it == gauges_.end()) return false;
    value = it->second;
    return true;
}

std::map<std::string, double> GaugeRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return gauges_;
}

std::string GaugeRegistry::to_prometheus() const {
    std::string out;
    for (const auto& kv : snapshot()) {
        std::string name = prometheus_name(kv.first);
        out += "# TYPE ";  out += name;  out += " gauge\n";
        out += name;  out += ' ';  append_double(out, kv.second);  out += '\n';
    }
    return out;
}

bool GaugeRegistry::write_prometheus_file(const std::string& path) const {
    // Write-then-rename so a textfile collector never sees a partial file.
    std::string tmp = path + ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::trunc);
        if (!ofs) {
            Logger::instance().warn("metrics: cannot open " + tmp);
            return false;
        }
        ofs << to_prometheus();
        if (!ofs) {
            Logger::instance().warn("metrics: write failed for " + tmp);
            return false;
        }
    }
    if (std::rename(tmp.c_str(), path.c_str()) != 0) {
        Logger::instance().warn("metrics: rename to " + path + " failed");
        std::remove(tmp.c_str());
        return false;
    }
    return true;
}

}
