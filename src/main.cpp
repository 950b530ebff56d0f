#include "core/ArgumentParser.h"
#include "core/Config.h"
#include "core/ConfigValidator.h"
#include "core/JSONWriter.h"
#include "core/Logging.h"
#include "core/Metrics.h"
#include "core/Privilege.h"
#include "core/ScanReport.h"
#include "net/ProcessEnumerator.h"
#include "net/ProcFilesystem.h"
#include "net/ScanError.h"
#include "net/SocketScanner.h"
#include "net/TickSource.h"
#include <chrono>
#include <fstream>
#include <iostream>
#include <thread>

using namespace sock_scan;

namespace {

enum ExitCode { kOk = 0, kUsage = 2, kScanFailed = 3, kSeccompFailed = 4, kTimedOut = 5 };

bool emit_output(const std::string& json, const Config& cfg) {
    if (cfg.output_file.empty()) {
        std::cout << json << std::flush;
        return static_cast<bool>(std::cout);
    }
    std::ofstream ofs(cfg.output_file, std::ios::trunc);
    if (!ofs) {
        Logger::instance().error("cannot open output file " + cfg.output_file);
        return false;
    }
    ofs << json;
    return static_cast<bool>(ofs);
}

// One enumerate + scan + emit cycle.
int run_once(SocketScanner& scanner, const ProcFilesystem& fs, TickSource& ticker, GaugeRegistry& gauges,
             const Config& cfg) {
    ScanReport report;
    SocketOwnerMap sockets;
    try {
        std::vector<ProcessHandle> processes = enumerate_processes(fs, cfg.proc_root);
        if (cfg.scan_timeout_seconds > 0) {
            BoundedTicker bounded(ticker, std::chrono::steady_clock::now() + std::chrono::seconds(cfg.scan_timeout_seconds));
            sockets = scanner.scan(processes, bounded, static_cast<size_t>(cfg.fd_block_size), &report);
        } else {
            sockets = scanner.scan(processes, ticker, static_cast<size_t>(cfg.fd_block_size), &report);
        }
    } catch (const ScanError& ex) {
        Logger::instance().error(std::string("scan failed: ") + ex.what());
        return kScanFailed;
    } catch (const TickBudgetExceeded& ex) {
        Logger::instance().error(std::string("scan aborted: ") + ex.what() + " (" +
                                 std::to_string(cfg.scan_timeout_seconds) + "s)");
        return kTimedOut;
    }

    JSONWriter writer;
    if (!emit_output(writer.write(sockets, report, gauges, cfg), cfg)) return kScanFailed;
    if (!cfg.metrics_file.empty() && !gauges.write_prometheus_file(cfg.metrics_file)) {
        Logger::instance().warn("metrics file " + cfg.metrics_file + " not updated");
    }
    Logger::instance().info("scan complete: " + std::to_string(sockets.size()) + " sockets attributed, " +
                            std::to_string(report.counters().namespaces) + " namespaces");
    return kOk;
}

}

int main(int argc, char** argv) {
    Logger::instance().set_level(LogLevel::Info);

    Config cfg;
    ArgumentParser parser;
    if (!parser.parse(argc, argv, cfg)) return parser.exit_code();

    ConfigValidator validator;
    validator.apply_env_overrides(cfg, parser.proc_root_given(), parser.log_level_given());
    if (!validator.validate(cfg)) return kUsage;

    LogLevel level;
    if (parse_log_level(cfg.log_level, level)) Logger::instance().set_level(level);

    if (cfg.drop_priv && !drop_capabilities()) {
        Logger::instance().warn("continuing with current privileges");
    }
    if (cfg.seccomp) {
        if (!apply_seccomp_profile()) {
            std::cerr << "Failed to apply seccomp profile";
            if (cfg.seccomp_strict) { std::cerr << "\n"; return kSeccompFailed; }
            std::cerr << " (continuing)\n";
        }
    }

    LinuxProcFilesystem fs;
    GaugeRegistry gauges;
    SocketScanner scanner(fs, cfg.proc_root, gauges);
    IntervalTicker ticker(std::chrono::milliseconds(cfg.tick_interval_ms));

    if (cfg.interval_seconds == 0) {
        return run_once(scanner, fs, ticker, gauges, cfg);
    }

    // Periodic mode: a failed scan is retried on the next interval.
    int rc = kOk;
    auto next = std::chrono::steady_clock::now();
    for (int i = 0; cfg.iterations == 0 || i < cfg.iterations; ++i) {
        rc = run_once(scanner, fs, ticker, gauges, cfg);
        next += std::chrono::seconds(cfg.interval_seconds);
        if (cfg.iterations != 0 && i + 1 >= cfg.iterations) break;
        std::this_thread::sleep_until(next);
    }
    return rc;
}
