#include "daemon/proc_inventory.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <utility>

#include <QDir>
#include <QFile>
#include <QList>
#include <QSet>
#include <QStorageInfo>
#include <QSysInfo>
#include <QThread>

#include <pwd.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace contmon {

namespace {

QList<QByteArray> fieldsOf(const QByteArray &line)
{
    return line.simplified().split(' ');
}

// "VmRSS:\t  1234 kB" -> 1234 for key "VmRSS".
std::optional<uint64_t> statusNumber(const QByteArray &line, const QByteArray &key)
{
    if (!line.startsWith(key + ':')) {
        return std::nullopt;
    }
    const QList<QByteArray> fields = fieldsOf(line.mid(key.size() + 1));
    if (fields.isEmpty()) {
        return std::nullopt;
    }
    bool ok = false;
    const qulonglong value = fields.first().toULongLong(&ok);
    if (!ok) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(value);
}

uint64_t counterDelta(uint64_t before, uint64_t after)
{
    return after > before ? after - before : 0;
}

void sleepFor(std::chrono::milliseconds window)
{
    if (window.count() > 0) {
        QThread::msleep(static_cast<unsigned long>(window.count()));
    }
}

} // namespace

std::optional<ProcStat> parseProcStat(const QByteArray &text)
{
    const qsizetype open = text.indexOf('(');
    const qsizetype close = text.lastIndexOf(')');
    if (open <= 0 || close < open) {
        return std::nullopt;
    }

    ProcStat stat;
    bool ok = false;
    stat.pid = text.left(open).trimmed().toInt(&ok);
    if (!ok) {
        return std::nullopt;
    }
    stat.comm = text.mid(open + 1, close - open - 1).toStdString();

    // Index 0 is the state (field 3 in proc(5)).
    const QList<QByteArray> rest = fieldsOf(text.mid(close + 1));
    if (rest.size() < 20 || rest[0].isEmpty()) {
        return std::nullopt;
    }
    stat.state = rest[0].at(0);

    bool allOk = true;
    const auto unsignedAt = [&](int index) {
        bool fieldOk = false;
        const qulonglong value = rest[index].toULongLong(&fieldOk);
        allOk = allOk && fieldOk;
        return static_cast<uint64_t>(value);
    };
    const auto signedAt = [&](int index) {
        bool fieldOk = false;
        const qlonglong value = rest[index].toLongLong(&fieldOk);
        allOk = allOk && fieldOk;
        return static_cast<int64_t>(value);
    };
    stat.utime = unsignedAt(11);
    stat.stime = unsignedAt(12);
    stat.priority = signedAt(15);
    stat.nice = signedAt(16);
    stat.numThreads = signedAt(17);
    stat.startTime = unsignedAt(19);
    if (!allOk) {
        return std::nullopt;
    }
    return stat;
}

ProcStatus parseProcStatus(const QByteArray &text)
{
    ProcStatus status;
    for (const QByteArray &line : text.split('\n')) {
        if (auto value = statusNumber(line, "VmSize")) {
            status.vmSizeKb = value;
        } else if (auto rss = statusNumber(line, "VmRSS")) {
            status.vmRssKb = rss;
        } else if (auto uid = statusNumber(line, "Uid")) {
            status.uid = static_cast<uint32_t>(*uid);
        }
    }
    return status;
}

std::optional<CpuTimes> parseCpuTimes(const QByteArray &text)
{
    for (const QByteArray &line : text.split('\n')) {
        if (!line.startsWith("cpu ")) {
            continue;
        }
        const QList<QByteArray> fields = fieldsOf(line);
        // user nice system idle [iowait irq softirq steal]
        if (fields.size() < 5) {
            return std::nullopt;
        }
        CpuTimes times;
        uint64_t idle = 0;
        const qsizetype last = std::min<qsizetype>(fields.size(), 9);
        for (qsizetype i = 1; i < last; ++i) {
            bool ok = false;
            const uint64_t value = fields[i].toULongLong(&ok);
            if (!ok) {
                return std::nullopt;
            }
            times.total += value;
            if (i == 4 || i == 5) {
                idle += value;
            }
        }
        times.busy = times.total - idle;
        return times;
    }
    return std::nullopt;
}

MemInfo parseMemInfo(const QByteArray &text)
{
    MemInfo info;
    for (const QByteArray &line : text.split('\n')) {
        if (auto total = statusNumber(line, "MemTotal")) {
            info.totalKb = *total;
        } else if (auto available = statusNumber(line, "MemAvailable")) {
            info.availableKb = *available;
        }
    }
    return info;
}

DiskIo parseDiskStats(const QByteArray &text)
{
    DiskIo io;
    for (const QByteArray &line : text.split('\n')) {
        const QList<QByteArray> parts = fieldsOf(line);
        if (parts.size() < 14) {
            continue;
        }
        const QByteArray &device = parts[2];
        if (device.isEmpty() || (device.back() >= '0' && device.back() <= '9')) {
            continue;
        }
        bool readOk = false;
        bool writeOk = false;
        const uint64_t readSectors = parts[5].toULongLong(&readOk);
        const uint64_t writeSectors = parts[9].toULongLong(&writeOk);
        if (!readOk || !writeOk) {
            continue;
        }
        io.readSectors += readSectors;
        io.writeSectors += writeSectors;
    }
    return io;
}

NetCounters parseNetDev(const QByteArray &text)
{
    NetCounters counters;
    for (const QByteArray &line : text.split('\n')) {
        const qsizetype colon = line.indexOf(':');
        if (colon < 0) {
            continue;
        }
        // rx: bytes packets errs drop fifo frame compressed multicast, then tx.
        const QList<QByteArray> fields = fieldsOf(line.mid(colon + 1));
        if (fields.size() < 9) {
            continue;
        }
        bool rxOk = false;
        bool txOk = false;
        const uint64_t rx = fields[0].toULongLong(&rxOk);
        const uint64_t tx = fields[8].toULongLong(&txOk);
        if (rxOk && txOk) {
            counters.rxBytes += rx;
            counters.txBytes += tx;
        }
    }
    return counters;
}

std::string processStateName(char state)
{
    switch (state) {
    case 'R':
        return "Running";
    case 'S':
        return "Sleeping";
    case 'D':
        return "Waiting";
    case 'Z':
        return "Zombie";
    case 'T':
        return "Stopped";
    case 't':
        return "Tracing";
    case 'X':
    case 'x':
        return "Dead";
    case 'K':
        return "Wakekill";
    case 'W':
        return "Waking";
    case 'P':
        return "Parked";
    case 'I':
        return "Idle";
    default:
        return "Unknown";
    }
}

std::string formatMemory(uint64_t kb)
{
    if (kb >= 1024 * 1024) {
        return std::to_string(kb / (1024 * 1024)) + "G";
    }
    if (kb >= 1024) {
        return std::to_string(kb / 1024) + "M";
    }
    return std::to_string(kb) + "K";
}

std::string formatRuntime(uint64_t seconds)
{
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%llu:%02llu:%02llu",
                  static_cast<unsigned long long>(seconds / 3600),
                  static_cast<unsigned long long>((seconds % 3600) / 60),
                  static_cast<unsigned long long>(seconds % 60));
    return buffer;
}

double cpuBusyPercent(const CpuTimes &before, const CpuTimes &after)
{
    const uint64_t total = counterDelta(before.total, after.total);
    if (total == 0) {
        return 0.0;
    }
    const uint64_t busy = counterDelta(before.busy, after.busy);
    return std::min(100.0, static_cast<double>(busy) * 100.0 / static_cast<double>(total));
}

double diskUsagePercent(const std::vector<VolumeSpace> &volumes)
{
    int64_t total = 0;
    int64_t used = 0;
    for (const VolumeSpace &volume : volumes) {
        if (volume.totalBytes <= 0) {
            continue;
        }
        total += volume.totalBytes;
        used += std::max<int64_t>(0, volume.totalBytes - volume.availableBytes);
    }
    if (total == 0) {
        return 0.0;
    }
    return static_cast<double>(used) * 100.0 / static_cast<double>(total);
}

double roundToTenth(double value)
{
    return std::round(value * 10.0) / 10.0;
}

std::string makeServerId(const std::string &hostname, const std::string &machineId)
{
    const std::string host = hostname.empty() ? "unknown" : hostname;
    const std::string id = machineId.empty() ? "unknown" : machineId;
    return host + "-" + id.substr(0, 8);
}

std::string localServerId()
{
    return makeServerId(QSysInfo::machineHostName().toStdString(),
                        QString::fromLatin1(QSysInfo::machineUniqueId()).toStdString());
}

std::string userNameForUid(std::optional<uint32_t> uid)
{
    if (!uid.has_value()) {
        return "unknown";
    }

    long size = sysconf(_SC_GETPW_R_SIZE_MAX);
    if (size <= 0) {
        size = 16384;
    }
    std::vector<char> buffer(static_cast<size_t>(size));
    passwd entry{};
    passwd *found = nullptr;
    if (getpwuid_r(*uid, &entry, buffer.data(), buffer.size(), &found) != 0 || found == nullptr) {
        return "unknown";
    }
    return found->pw_name;
}

ProcInventory::ProcInventory(QString procRoot, long ticksPerSecond)
    : m_procRoot(std::move(procRoot))
    , m_ticksPerSecond(ticksPerSecond > 0 ? ticksPerSecond : sysconf(_SC_CLK_TCK))
{
    if (m_ticksPerSecond <= 0) {
        m_ticksPerSecond = 100;
    }
}

void ProcInventory::setVolumes(std::vector<VolumeSpace> volumes)
{
    m_volumes = std::move(volumes);
}

QByteArray ProcInventory::readProcFile(const QString &relativePath) const
{
    QFile file(m_procRoot + QLatin1Char('/') + relativePath);
    if (!file.open(QIODevice::ReadOnly)) {
        return {};
    }
    return file.readAll();
}

std::optional<ProcStat> ProcInventory::readStat(const QString &relativeDir) const
{
    const QByteArray text = readProcFile(relativeDir + QStringLiteral("/stat"));
    if (text.isEmpty()) {
        return std::nullopt;
    }
    return parseProcStat(text);
}

double ProcInventory::uptimeSeconds() const
{
    const QList<QByteArray> fields = fieldsOf(readProcFile(QStringLiteral("uptime")));
    if (fields.isEmpty()) {
        return 0.0;
    }
    bool ok = false;
    const double uptime = fields.first().toDouble(&ok);
    return ok ? uptime : 0.0;
}

std::vector<int> ProcInventory::listPids() const
{
    std::vector<int> pids;
    const QStringList entries = QDir(m_procRoot).entryList(QDir::Dirs | QDir::NoDotAndDotDot);
    for (const QString &entry : entries) {
        bool ok = false;
        const int pid = entry.toInt(&ok);
        if (ok && pid > 0) {
            pids.push_back(pid);
        }
    }
    std::sort(pids.begin(), pids.end());
    return pids;
}

std::vector<ThreadInfo> ProcInventory::threadDetails(int pid, const std::string &userName) const
{
    const QString taskDir = QString::number(pid) + QStringLiteral("/task");
    std::vector<int> tids;
    for (const QString &entry : QDir(m_procRoot + QLatin1Char('/') + taskDir)
                                    .entryList(QDir::Dirs | QDir::NoDotAndDotDot)) {
        bool ok = false;
        const int tid = entry.toInt(&ok);
        if (ok) {
            tids.push_back(tid);
        }
    }
    std::sort(tids.begin(), tids.end());

    const double uptime = uptimeSeconds();
    std::vector<ThreadInfo> threads;
    for (int tid : tids) {
        if (threads.size() >= kMaxThreadDetails) {
            break;
        }
        const QString dir = taskDir + QLatin1Char('/') + QString::number(tid);
        const std::optional<ProcStat> stat = readStat(dir);
        if (!stat.has_value()) {
            continue;
        }
        const ProcStatus status = parseProcStatus(readProcFile(dir + QStringLiteral("/status")));

        const double started = static_cast<double>(stat->startTime)
            / static_cast<double>(m_ticksPerSecond);
        const auto runtime = static_cast<uint64_t>(std::max(0.0, uptime - started));

        ThreadInfo thread;
        thread.threadId = stat->pid;
        thread.userName = userName;
        thread.priority = stat->priority;
        thread.niceValue = stat->nice;
        thread.virtualMemory = formatMemory(status.vmSizeKb.value_or(0));
        thread.residentMemory = formatMemory(status.vmRssKb.value_or(0));
        thread.status = processStateName(stat->state);
        thread.runtime = formatRuntime(runtime);
        thread.command = stat->comm;
        threads.push_back(std::move(thread));
    }
    return threads;
}

ProcessInfo ProcInventory::describeProcess(const ProcStat &stat,
                                           const ProcStatus &status,
                                           const std::string &serverId,
                                           int64_t timestampMs,
                                           double cpuUsage,
                                           uint64_t memTotalKb) const
{
    ProcessInfo process;
    process.serverId = serverId;
    process.pid = stat.pid;
    process.name = stat.comm;
    process.userName = userNameForUid(status.uid);
    process.status = processStateName(stat.state);
    process.timestamp = timestampMs;

    ProcessTrend trend;
    trend.timestamp = timestampMs;
    trend.cpuUsage = roundToTenth(cpuUsage);
    if (memTotalKb > 0) {
        trend.memoryUsage = roundToTenth(static_cast<double>(status.vmRssKb.value_or(0)) * 100.0
                                         / static_cast<double>(memTotalKb));
    }
    trend.threadCount = stat.numThreads;
    process.trend.push_back(trend);

    process.threads = threadDetails(stat.pid, process.userName);
    return process;
}

std::vector<ProcessInfo> ProcInventory::sampleProcesses(const std::vector<int> &pids,
                                                        const std::string &serverId,
                                                        int64_t timestampMs,
                                                        std::chrono::milliseconds sampleWindow) const
{
    std::vector<std::pair<int, uint64_t>> before;
    for (int pid : pids) {
        if (const auto stat = readStat(QString::number(pid))) {
            before.emplace_back(pid, stat->utime + stat->stime);
        }
    }
    sleepFor(sampleWindow);

    const uint64_t memTotalKb = parseMemInfo(readProcFile(QStringLiteral("meminfo"))).totalKb;
    const double windowSeconds = static_cast<double>(sampleWindow.count()) / 1000.0;

    std::vector<ProcessInfo> processes;
    for (const auto &[pid, ticksBefore] : before) {
        const QString dir = QString::number(pid);
        const std::optional<ProcStat> stat = readStat(dir);
        if (!stat.has_value()) {
            continue;
        }
        double cpuUsage = 0.0;
        if (windowSeconds > 0.0) {
            const uint64_t ticks = counterDelta(ticksBefore, stat->utime + stat->stime);
            cpuUsage = static_cast<double>(ticks) / static_cast<double>(m_ticksPerSecond)
                / windowSeconds * 100.0;
        }
        const ProcStatus status = parseProcStatus(readProcFile(dir + QStringLiteral("/status")));
        processes.push_back(describeProcess(*stat, status, serverId, timestampMs, cpuUsage,
                                            memTotalKb));
    }
    return processes;
}

std::vector<ProcessInfo> ProcInventory::collectProcesses(const std::string &serverId,
                                                         int64_t timestampMs,
                                                         std::chrono::milliseconds sampleWindow)
{
    const std::vector<int> pids = listPids();
    std::vector<int> candidates;
    for (int pid : pids) {
        const auto stat = readStat(QString::number(pid));
        if (stat.has_value() && stat->numThreads >= kMinReportedThreads) {
            candidates.push_back(pid);
        }
    }

    CMLOG_DEBUG(QStringLiteral("ProcInventory"),
                QStringLiteral("collectProcesses"),
                QStringLiteral("processes_selected"),
                QString(),
                QString(),
                (nlohmann::json{{"scanned", pids.size()},
                                {"selected", candidates.size()},
                                {"minThreads", kMinReportedThreads}}));

    return sampleProcesses(candidates, serverId, timestampMs, sampleWindow);
}

std::optional<ProcessInfo> ProcInventory::maxThreadsProcess(const std::string &serverId,
                                                            int64_t timestampMs,
                                                            std::chrono::milliseconds sampleWindow)
{
    std::optional<ProcStat> busiest;
    for (int pid : listPids()) {
        const auto stat = readStat(QString::number(pid));
        if (stat.has_value() && (!busiest || stat->numThreads > busiest->numThreads)) {
            busiest = stat;
        }
    }
    if (!busiest.has_value()) {
        return std::nullopt;
    }

    std::vector<ProcessInfo> sampled =
        sampleProcesses({busiest->pid}, serverId, timestampMs, sampleWindow);
    if (sampled.empty()) {
        return std::nullopt;
    }
    return std::move(sampled.front());
}

std::vector<VolumeSpace> ProcInventory::mountedVolumes() const
{
    if (m_volumes.has_value()) {
        return *m_volumes;
    }

    std::vector<VolumeSpace> volumes;
    QSet<QByteArray> seen;
    for (const QStorageInfo &storage : QStorageInfo::mountedVolumes()) {
        if (!storage.isValid() || !storage.isReady()) {
            continue;
        }
        const QByteArray device = storage.device();
        if (!device.startsWith("/dev/") || seen.contains(device)) {
            continue;
        }
        seen.insert(device);
        volumes.push_back({storage.bytesTotal(), storage.bytesAvailable()});
    }
    return volumes;
}

MetricsSample ProcInventory::collectMetrics(const std::string &serverId,
                                            int64_t timestampMs,
                                            std::chrono::milliseconds cpuWindow,
                                            std::chrono::milliseconds netWindow)
{
    MetricsSample metrics;
    metrics.serverId = serverId;
    metrics.timestamp = timestampMs;

    const std::optional<CpuTimes> cpuBefore = parseCpuTimes(readProcFile(QStringLiteral("stat")));
    sleepFor(cpuWindow);
    const std::optional<CpuTimes> cpuAfter = parseCpuTimes(readProcFile(QStringLiteral("stat")));
    if (cpuBefore && cpuAfter) {
        metrics.cpuUsage = roundToTenth(cpuBusyPercent(*cpuBefore, *cpuAfter));
    } else {
        CMLOG_WARN(QStringLiteral("ProcInventory"),
                   QStringLiteral("collectMetrics"),
                   QStringLiteral("cpu_times_unavailable"),
                   QStringLiteral("stat_unreadable"),
                   QString(),
                   (nlohmann::json{{"procRoot", m_procRoot.toStdString()}}));
    }

    const MemInfo memory = parseMemInfo(readProcFile(QStringLiteral("meminfo")));
    if (memory.totalKb > 0) {
        const uint64_t used = counterDelta(memory.availableKb, memory.totalKb);
        metrics.memoryUsage = roundToTenth(static_cast<double>(used) * 100.0
                                           / static_cast<double>(memory.totalKb));
    }

    metrics.diskUsage = roundToTenth(diskUsagePercent(mountedVolumes()));

    constexpr double kSectorBytes = 512.0;
    constexpr double kMiB = 1024.0 * 1024.0;
    const DiskIo io = parseDiskStats(readProcFile(QStringLiteral("diskstats")));
    metrics.ioRead = roundToTenth(static_cast<double>(io.readSectors) * kSectorBytes / kMiB);
    metrics.ioWrite = roundToTenth(static_cast<double>(io.writeSectors) * kSectorBytes / kMiB);

    const NetCounters netBefore = parseNetDev(readProcFile(QStringLiteral("net/dev")));
    sleepFor(netWindow);
    const NetCounters netAfter = parseNetDev(readProcFile(QStringLiteral("net/dev")));
    metrics.networkIn =
        roundToTenth(static_cast<double>(counterDelta(netBefore.rxBytes, netAfter.rxBytes)) / 1024.0);
    metrics.networkOut =
        roundToTenth(static_cast<double>(counterDelta(netBefore.txBytes, netAfter.txBytes)) / 1024.0);

    return metrics;
}

} // namespace contmon
