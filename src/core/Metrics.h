#pragma once
#include <map>
#include <mutex>
#include <string>

namespace sock_scan {

class MetricsSink {
public:
    virtual ~MetricsSink() = default;
    virtual void set_gauge(const std::string& name, double value) = 0;
};

// In-process gauge store; last value wins per name.
class GaugeRegistry : public MetricsSink {
public:
    void set_gauge(const std::string& name, double value) override;

    // Inspection only; exporters use snapshot().
    bool get(const std::string& name, double& value) const;
    std::map<std::string, double> snapshot() const;

    // Prometheus text exposition format; '.' and '-' in names become '_'.
    std::string to_prometheus() const;
    bool write_prometheus_file(const std::string& path) const;

private:
    std::map<std::string, double> gauges_;
    mutable std::mutex mutex_;
};

}
