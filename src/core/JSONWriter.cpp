#include "JSONWriter.h"
#include "BuildInfo.h"
#include "Config.h"
#include "JsonUtil.h"
#include "Metrics.h"
#include "ScanReport.h"
#include <algorithm>
#include <charconv>
#include <chrono>
#include <cstdlib>
#include <map>
#include <sstream>
#include <vector>
#include <sys/utsname.h>

namespace sock_scan {
namespace {
    struct HostMeta {
        std::string hostname;
        std::string kernel;
        std::string arch;
    };

    struct CanonVal {
        enum Type { T_OBJ, T_ARR, T_STR, T_NUM } type = T_OBJ;
        std::map<std::string, CanonVal> obj;
        std::vector<CanonVal> arr;
        std::string str; // for string & number token text
        CanonVal() = default;
        explicit CanonVal(Type t): type(t) {}
    };

    using jsonutil::escape; using jsonutil::time_to_iso;

    static void canon_emit(const CanonVal& v, std::ostream& os, int indent, int depth);

    static HostMeta collect_host_meta() {
        HostMeta h;
        struct utsname u{};
        if (uname(&u) == 0) {
            h.kernel = u.release;
            h.arch = u.machine;
            h.hostname = u.nodename;
        }
        auto get = [](const char* k)->const char*{ const char* v=getenv(k); return (v && *v)? v: nullptr; };
        if(auto v=get("SOCK_SCAN_META_HOSTNAME")) h.hostname=v;
        if(auto v=get("SOCK_SCAN_META_KERNEL")) h.kernel=v;
        return h;
    }

    static void put_str(CanonVal& o, const std::string& k, const std::string& v) {
        o.obj[k].type = CanonVal::T_STR;
        o.obj[k].str = v;
    }

    static void put_num(CanonVal& o, const std::string& k, unsigned long long v) {
        o.obj[k].type = CanonVal::T_NUM;
        o.obj[k].str = std::to_string(v);
    }

    static void put_double(CanonVal& o, const std::string& k, double v) {
        char buf[32];
        auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
        o.obj[k].type = CanonVal::T_NUM;
        o.obj[k].str = (ec == std::errc{}) ? std::string(buf, ptr) : "0";
    }

    static void newline(std::ostream& os, int indent, int depth) {
        if (indent <= 0) return;
        os << '\n';
        for (int i = 0; i < indent * depth; ++i) os << ' ';
    }

    static void emit_array(const CanonVal& v, std::ostream& os, int indent, int depth) {
        os << '[';
        bool first = true;
        for (const auto& e : v.arr) {
            if (!first) os << ',';
            first = false;
            newline(os, indent, depth + 1);
            canon_emit(e, os, indent, depth + 1);
        }
        if (!v.arr.empty()) newline(os, indent, depth);
        os << ']';
    }

    static void emit_object(const CanonVal& v, std::ostream& os, int indent, int depth) {
        os << '{';
        bool first = true;
        for (const auto& kv : v.obj) {
            if (!first) os << ',';
            first = false;
            newline(os, indent, depth + 1);
            os << '"' << escape(kv.first) << '"' << ':';
            if (indent > 0) os << ' ';
            canon_emit(kv.second, os, indent, depth + 1);
        }
        if (!v.obj.empty()) newline(os, indent, depth);
        os << '}';
    }

    static void canon_emit(const CanonVal& v, std::ostream& os, int indent, int depth) {
        switch (v.type) {
            case CanonVal::T_STR:
                os << '"' << escape(v.str) << '"';
                break;
            case CanonVal::T_NUM:
                os << v.str;
                break;
            case CanonVal::T_ARR:
                emit_array(v, os, indent, depth);
                break;
            case CanonVal::T_OBJ:
                emit_object(v, os, indent, depth);
                break;
        }
    }

    static CanonVal build_meta_object(const HostMeta& host, const ScanReport& report, const Config& cfg) {
        CanonVal meta{CanonVal::T_OBJ};
        put_str(meta, "arch", host.arch);
        put_str(meta, "hostname", host.hostname);
        put_str(meta, "kernel", host.kernel);
        put_str(meta, "proc_root", cfg.proc_root);
        put_str(meta, "tool_version", buildinfo::APP_VERSION);
        put_str(meta, "git_commit", buildinfo::GIT_COMMIT);
        if (std::getenv("SOCK_SCAN_CANON_TIME_ZERO")) {
            put_str(meta, "start_time", time_to_iso(std::chrono::system_clock::time_point{}));
            put_str(meta, "end_time", time_to_iso(std::chrono::system_clock::time_point{}));
            put_num(meta, "duration_ms", 0);
        } else {
            put_str(meta, "start_time", time_to_iso(report.start_time()));
            put_str(meta, "end_time", time_to_iso(report.end_time()));
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(report.end_time() - report.start_time()).count();
            put_num(meta, "duration_ms", ms > 0 ? static_cast<unsigned long long>(ms) : 0);
        }
        return meta;
    }

    static CanonVal build_summary_object(const ScanReport& report, const Config& cfg) {
        const ScanCounters c = report.counters();
        CanonVal summary{CanonVal::T_OBJ};
        put_num(summary, "processes", c.processes);
        put_num(summary, "processes_skipped", c.processes_skipped);
        put_num(summary, "namespaces", c.namespaces);
        put_num(summary, "empty_namespaces", c.empty_namespaces);
        put_num(summary, "table_reads", c.table_reads);
        put_num(summary, "descriptors", c.descriptors);
        put_num(summary, "socket_descriptors", c.socket_descriptors);
        put_num(summary, "rate_limit_pauses", c.pauses);
        put_num(summary, "sockets", c.sockets);
        put_num(summary, "fd_block_size", static_cast<unsigned long long>(cfg.fd_block_size));
        put_num(summary, "tick_interval_ms", static_cast<unsigned long long>(cfg.tick_interval_ms));
        return summary;
    }

    static CanonVal build_sockets_array(const SocketOwnerMap& sockets) {
        std::vector<uint64_t> inodes;
        inodes.reserve(sockets.size());
        for (const auto& kv : sockets) inodes.push_back(kv.first);
        std::sort(inodes.begin(), inodes.end());

        CanonVal arr{CanonVal::T_ARR};
        arr.arr.reserve(inodes.size());
        for (uint64_t inode : inodes) {
            const auto& owner = sockets.at(inode);
            CanonVal s{CanonVal::T_OBJ};
            put_num(s, "inode", inode);
            put_num(s, "pid", owner ? static_cast<unsigned long long>(owner->pid) : 0);
            put_str(s, "name", owner ? owner->name : "");
            arr.arr.push_back(std::move(s));
        }
        return arr;
    }

    static CanonVal build_warnings_array(const ScanReport& report) {
        CanonVal arr{CanonVal::T_ARR};
        for (const auto& w : report.warnings()) {
            CanonVal o{CanonVal::T_OBJ};
            put_str(o, "code", warn_code_name(w.code));
            put_str(o, "detail", w.detail);
            arr.arr.push_back(std::move(o));
        }
        return arr;
    }

    static CanonVal build_gauges_object(const GaugeRegistry& gauges) {
        CanonVal o{CanonVal::T_OBJ};
        for (const auto& kv : gauges.snapshot()) put_double(o, kv.first, kv.second);
        return o;
    }
}

std::string JSONWriter::write(const SocketOwnerMap& sockets, const ScanReport& report, const GaugeRegistry& gauges,
                              const Config& cfg) const {
    CanonVal root{CanonVal::T_OBJ};
    root.obj["meta"] = build_meta_object(collect_host_meta(), report, cfg);
    root.obj["summary"] = build_summary_object(report, cfg);
    root.obj["sockets"] = build_sockets_array(sockets);
    root.obj["warnings"] = build_warnings_array(report);
    root.obj["gauges"] = build_gauges_object(gauges);

    std::ostringstream os;
    int indent = (cfg.pretty && !cfg.compact) ? 2 : 0;
    canon_emit(root, os, indent, 0);
    os << '\n';
    return os.str();
}

}
