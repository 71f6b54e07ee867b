#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace contmon {

// Seconds since boot as printed by the kernel ring buffer. Held as an integer
// count so that parsing and comparison are exact.
using BootOffset = std::chrono::nanoseconds;

inline constexpr const char *kUnknownBootId = "unknown";

struct Checkpoint {
    std::string bootId;
    BootOffset lastLogOffset{0};
};

struct LogEntry {
    // Empty for continuation lines and anything without a leading [sec.frac].
    std::optional<BootOffset> timestamp;
    std::string rawText;
};

// Always the whole retained ring buffer, never a delta.
using LogBatch = std::vector<LogEntry>;

struct ExtractionResult {
    std::vector<LogEntry> newEntries;
    BootOffset newOffset{0};
};

struct HostSample {
    std::string hostname;
    std::string ipAddress;
    std::string cpuInfo;
    std::string memoryInfo;
    std::string swapInfo;
};

struct MonitorSnapshot {
    std::string hostname;
    std::string ipAddress;
    std::string timestamp;
    std::string cpuInfo;
    std::string memoryInfo;
    std::string swapInfo;
    std::string threadInfo;
    std::string dmesg;
};

struct ThreadInfo {
    int threadId = 0;
    std::string userName;
    int64_t priority = 0;
    int64_t niceValue = 0;
    std::string virtualMemory;
    std::string residentMemory;
    std::string sharedMemory = "0K";
    std::string status;
    // Per-thread usage is not sampled; both stay "0.0".
    std::string cpuUsage = "0.0";
    std::string memoryUsage = "0.0";
    std::string runtime;
    std::string command;
};

struct ProcessTrend {
    int64_t timestamp = 0;
    double cpuUsage = 0.0;
    double memoryUsage = 0.0;
    int64_t threadCount = 0;
};

struct ProcessInfo {
    std::string serverId;
    int pid = 0;
    std::string name;
    std::string userName;
    std::string status;
    int64_t timestamp = 0;
    std::vector<ProcessTrend> trend;
    // At most the first ten tasks by thread id.
    std::vector<ThreadInfo> threads;
};

// Percentages and rates rounded to one decimal.
struct MetricsSample {
    std::string serverId;
    int64_t timestamp = 0;
    double cpuUsage = 0.0;
    double memoryUsage = 0.0;
    double diskUsage = 0.0;
    double ioRead = 0.0;     // MiB read since boot
    double ioWrite = 0.0;    // MiB written since boot
    double networkIn = 0.0;  // KiB received during the sample window
    double networkOut = 0.0; // KiB sent during the sample window
};

} // namespace contmon
