#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <QByteArray>
#include <QString>

#include "common/models.hpp"

namespace contmon {

// Processes with fewer threads are left out of the process report.
constexpr int64_t kMinReportedThreads = 20;
constexpr size_t kMaxThreadDetails = 10;

// Fields of /proc/<pid>/stat (or a task's stat) that the reports use.
struct ProcStat {
    int pid = 0;
    std::string comm;
    char state = '?';
    uint64_t utime = 0;
    uint64_t stime = 0;
    int64_t priority = 0;
    int64_t nice = 0;
    int64_t numThreads = 0;
    uint64_t startTime = 0; // clock ticks after boot
};

struct ProcStatus {
    std::optional<uint64_t> vmSizeKb;
    std::optional<uint64_t> vmRssKb;
    std::optional<uint32_t> uid;
};

struct CpuTimes {
    uint64_t busy = 0;
    uint64_t total = 0;
};

struct MemInfo {
    uint64_t totalKb = 0;
    uint64_t availableKb = 0;
};

struct DiskIo {
    uint64_t readSectors = 0;
    uint64_t writeSectors = 0;
};

struct NetCounters {
    uint64_t rxBytes = 0;
    uint64_t txBytes = 0;
};

struct VolumeSpace {
    int64_t totalBytes = 0;
    int64_t availableBytes = 0;
};

// The command name may contain spaces and parentheses, so fields are counted
// from the last ')'.
std::optional<ProcStat> parseProcStat(const QByteArray &text);

ProcStatus parseProcStatus(const QByteArray &text);

// Aggregate "cpu " line of /proc/stat. idle and iowait count as not busy.
std::optional<CpuTimes> parseCpuTimes(const QByteArray &text);

MemInfo parseMemInfo(const QByteArray &text);

// Sums whole devices only: names ending in a digit are taken as partitions.
DiskIo parseDiskStats(const QByteArray &text);

NetCounters parseNetDev(const QByteArray &text);

// Kernel state letter to a word, e.g. 'S' -> "Sleeping".
std::string processStateName(char state);

// 512 -> "512K", 2048 -> "2M", 3145728 -> "3G". Units are truncated.
std::string formatMemory(uint64_t kb);

// H:MM:SS with unbounded hours.
std::string formatRuntime(uint64_t seconds);

double cpuBusyPercent(const CpuTimes &before, const CpuTimes &after);

double diskUsagePercent(const std::vector<VolumeSpace> &volumes);

double roundToTenth(double value);

// "<hostname>-<first 8 chars of machine id>", each part "unknown" when empty.
std::string makeServerId(const std::string &hostname, const std::string &machineId);

// Server id of this machine from its hostname and /etc/machine-id.
std::string localServerId();

// User name for a uid from the password database, "unknown" if absent.
std::string userNameForUid(std::optional<uint32_t> uid);

/**
 * Reads process, thread and host counters from a procfs tree. The root is
 * configurable so that reports can be built from a captured or synthetic
 * tree. Unreadable entries are skipped; processes come and go between reads.
 */
class ProcInventory {
public:
    // ticksPerSecond 0 means sysconf(_SC_CLK_TCK).
    explicit ProcInventory(QString procRoot = QStringLiteral("/proc"), long ticksPerSecond = 0);

    // Processes with at least kMinReportedThreads threads, by pid. CPU usage
    // is measured across sampleWindow.
    std::vector<ProcessInfo> collectProcesses(const std::string &serverId,
                                              int64_t timestampMs,
                                              std::chrono::milliseconds sampleWindow);

    // The single process with the most threads; ties go to the lowest pid.
    std::optional<ProcessInfo> maxThreadsProcess(const std::string &serverId,
                                                 int64_t timestampMs,
                                                 std::chrono::milliseconds sampleWindow);

    // CPU is sampled across cpuWindow, network counters across netWindow.
    // Disk usage covers mounted block devices.
    MetricsSample collectMetrics(const std::string &serverId,
                                 int64_t timestampMs,
                                 std::chrono::milliseconds cpuWindow,
                                 std::chrono::milliseconds netWindow);

    std::vector<int> listPids() const;
    std::vector<ThreadInfo> threadDetails(int pid, const std::string &userName) const;

    // Overridable for tests; defaults to QStorageInfo's mounted volumes.
    void setVolumes(std::vector<VolumeSpace> volumes);

private:
    QByteArray readProcFile(const QString &relativePath) const;
    std::optional<ProcStat> readStat(const QString &relativeDir) const;
    double uptimeSeconds() const;
    ProcessInfo describeProcess(const ProcStat &stat,
                                const ProcStatus &status,
                                const std::string &serverId,
                                int64_t timestampMs,
                                double cpuUsage,
                                uint64_t memTotalKb) const;
    std::vector<ProcessInfo> sampleProcesses(const std::vector<int> &pids,
                                             const std::string &serverId,
                                             int64_t timestampMs,
                                             std::chrono::milliseconds sampleWindow) const;
    std::vector<VolumeSpace> mountedVolumes() const;

    QString m_procRoot;
    long m_ticksPerSecond;
    std::optional<std::vector<VolumeSpace>> m_volumes;
};

} // namespace contmon
