#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace contmon {

// Local time with numeric UTC offset, e.g. 2026-10-19T18:54:00+02:00.
inline std::string toIso8601WithOffset(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
    localtime_r(&time, &tm);

    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");

    // strftime's %z has no colon; insert it by hand.
    long offset = tm.tm_gmtoff;
    const char sign = offset < 0 ? '-' : '+';
    if (offset < 0) {
        offset = -offset;
    }
    char zone[16];
    std::snprintf(zone, sizeof(zone), "%c%02ld:%02ld", sign, offset / 3600,
                  (offset % 3600) / 60);
    out << zone;
    return out.str();
}

// Formats a boot offset as decimal seconds. Six fractional digits match the
// kernel's microsecond stamps; nine are used when finer precision is present.
inline std::string formatBootOffset(BootOffset offset)
{
    const int64_t total = offset.count() < 0 ? 0 : offset.count();
    const auto seconds = static_cast<unsigned long long>(total / 1000000000LL);
    const auto nanos = static_cast<unsigned long long>(total % 1000000000LL);

    char buffer[40];
    if (nanos % 1000 == 0) {
        std::snprintf(buffer, sizeof(buffer), "%llu.%06llu", seconds, nanos / 1000);
    } else {
        std::snprintf(buffer, sizeof(buffer), "%llu.%09llu", seconds, nanos);
    }
    return buffer;
}

// Parses "<digits>[.<digits>]" into a boot offset without going through
// floating point. Fractional digits past nanoseconds are truncated.
inline std::optional<BootOffset> parseBootOffset(const std::string &value)
{
    size_t pos = 0;
    while (pos < value.size() && (value[pos] == ' ' || value[pos] == '\t')) {
        ++pos;
    }

    const size_t intStart = pos;
    uint64_t seconds = 0;
    while (pos < value.size() && value[pos] >= '0' && value[pos] <= '9') {
        seconds = seconds * 10 + static_cast<uint64_t>(value[pos] - '0');
        if (seconds > 9000000000ULL) {
            return std::nullopt;
        }
        ++pos;
    }
    if (pos == intStart) {
        return std::nullopt;
    }

    uint64_t nanos = 0;
    if (pos < value.size() && value[pos] == '.') {
        ++pos;
        const size_t fracStart = pos;
        int digits = 0;
        while (pos < value.size() && value[pos] >= '0' && value[pos] <= '9') {
            if (digits < 9) {
                nanos = nanos * 10 + static_cast<uint64_t>(value[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (pos == fracStart) {
            return std::nullopt;
        }
        for (; digits < 9; ++digits) {
            nanos *= 10;
        }
    }

    while (pos < value.size() && (value[pos] == ' ' || value[pos] == '\t')) {
        ++pos;
    }
    if (pos != value.size()) {
        return std::nullopt;
    }

    return BootOffset{static_cast<int64_t>(seconds * 1000000000ULL + nanos)};
}

inline void to_json(nlohmann::json &j, const MonitorSnapshot &snapshot)
{
    j = nlohmann::json{
        {"hostname", snapshot.hostname},
        {"ip_address", snapshot.ipAddress},
        {"timestamp", snapshot.timestamp},
        {"system_metrics", nlohmann::json{
            {"cpu_info", snapshot.cpuInfo},
            {"memory_info", snapshot.memoryInfo},
            {"swap_info", snapshot.swapInfo},
            {"threadinfo", snapshot.threadInfo}
        }},
        {"logs", nlohmann::json{
            {"dmesg", snapshot.dmesg}
        }}
    };
}

inline void from_json(const nlohmann::json &j, MonitorSnapshot &snapshot)
{
    snapshot.hostname = j.value("hostname", "");
    snapshot.ipAddress = j.value("ip_address", "");
    snapshot.timestamp = j.value("timestamp", "");

    const nlohmann::json metrics = j.value("system_metrics", nlohmann::json::object());
    snapshot.cpuInfo = metrics.value("cpu_info", "");
    snapshot.memoryInfo = metrics.value("memory_info", "");
    snapshot.swapInfo = metrics.value("swap_info", "");
    snapshot.threadInfo = metrics.value("threadinfo", "");

    const nlohmann::json logs = j.value("logs", nlohmann::json::object());
    snapshot.dmesg = logs.value("dmesg", "");
}

inline void to_json(nlohmann::json &j, const Checkpoint &checkpoint)
{
    j = nlohmann::json{
        {"boot_id", checkpoint.bootId},
        {"last_log_offset", formatBootOffset(checkpoint.lastLogOffset)}
    };
}

inline void to_json(nlohmann::json &j, const ThreadInfo &thread)
{
    j = nlohmann::json{
        {"threadId", thread.threadId},
        {"userName", thread.userName},
        {"priority", thread.priority},
        {"niceValue", thread.niceValue},
        {"virtualMemory", thread.virtualMemory},
        {"residentMemory", thread.residentMemory},
        {"sharedMemory", thread.sharedMemory},
        {"status", thread.status},
        {"cpuUsage", thread.cpuUsage},
        {"memoryUsage", thread.memoryUsage},
        {"runtime", thread.runtime},
        {"command", thread.command}
    };
}

inline void to_json(nlohmann::json &j, const ProcessTrend &trend)
{
    j = nlohmann::json{
        {"timestamp", trend.timestamp},
        {"cpuUsage", trend.cpuUsage},
        {"memoryUsage", trend.memoryUsage},
        {"threadCount", trend.threadCount}
    };
}

inline void to_json(nlohmann::json &j, const ProcessInfo &process)
{
    j = nlohmann::json{
        {"serverId", process.serverId},
        {"pid", process.pid},
        {"name", process.name},
        {"userName", process.userName},
        {"status", process.status},
        {"timestamp", process.timestamp},
        {"trend", process.trend},
        {"threads", process.threads}
    };
}

inline void to_json(nlohmann::json &j, const MetricsSample &metrics)
{
    j = nlohmann::json{
        {"serverId", metrics.serverId},
        {"timestamp", metrics.timestamp},
        {"cpuUsage", metrics.cpuUsage},
        {"memoryUsage", metrics.memoryUsage},
        {"diskUsage", metrics.diskUsage},
        {"ioRead", metrics.ioRead},
        {"ioWrite", metrics.ioWrite},
        {"networkIn", metrics.networkIn},
        {"networkOut", metrics.networkOut}
    };
}

// One-shot reports are printed as pretty JSON arrays.
inline std::string dumpReport(const nlohmann::json &report)
{
    return report.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

// Serializes a snapshot the way it is published. Pass-through text from
// external tools may not be valid UTF-8, so bad bytes are replaced instead of
// failing the whole document.
inline std::string dumpSnapshot(const MonitorSnapshot &snapshot, int indent = 2)
{
    const nlohmann::json j = snapshot;
    return j.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace contmon
