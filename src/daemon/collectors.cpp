#include "daemon/collectors.hpp"

#include <algorithm>
#include <utility>

#include <QFile>
#include <QStringList>

#include <unistd.h>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "common/process_utils.hpp"
#include "daemon/kmsg_parser.hpp"

namespace contmon {

namespace {

constexpr int kDmesgTimeoutMs = 5000;
constexpr int kTopTimeoutMs = 5000;
constexpr int kIpTimeoutMs = 2000;

std::string localHostname()
{
    char hostname[256] = {};
    if (gethostname(hostname, sizeof(hostname) - 1) != 0) {
        return {};
    }
    return hostname;
}

} // namespace

ProcBootIdSource::ProcBootIdSource(std::string path)
    : m_path(std::move(path))
{
}

std::string ProcBootIdSource::currentBootId()
{
    return readBootId(m_path);
}

LogBatch DmesgLogSource::readBuffer()
{
    const CommandResult result = runCommand(QStringLiteral("dmesg"),
                                            {QStringLiteral("--color=never")},
                                            kDmesgTimeoutMs);
    if (!result.started || result.exitCode != 0) {
        // Restricted kernels (dmesg_restrict) land here; treat as no new logs.
        CMLOG_DEBUG(QStringLiteral("DmesgLogSource"),
                    QStringLiteral("readBuffer"),
                    QStringLiteral("dmesg_unavailable"),
                    result.started ? QStringLiteral("non_zero_exit")
                                   : QStringLiteral("not_started"),
                    QString(),
                    (nlohmann::json{{"exitCode", result.exitCode}}));
        return {};
    }

    return parseRingBufferOutput(result.output.toStdString());
}

FileLogSource::FileLogSource(QString path)
    : m_path(std::move(path))
{
}

LogBatch FileLogSource::readBuffer()
{
    QFile file(m_path);
    if (!file.open(QIODevice::ReadOnly)) {
        CMLOG_DEBUG(QStringLiteral("FileLogSource"),
                    QStringLiteral("readBuffer"),
                    QStringLiteral("dump_unreadable"),
                    file.errorString(),
                    QString(),
                    (nlohmann::json{{"path", m_path.toStdString()}}));
        return {};
    }
    return parseRingBufferOutput(file.readAll().toStdString());
}

HostSample CommandHostSampler::sample()
{
    HostSample sample;
    sample.hostname = localHostname();

    const CommandResult hostnameI = runCommand(QStringLiteral("hostname"),
                                               {QStringLiteral("-I")},
                                               kIpTimeoutMs);
    if (hostnameI.exitCode == 0) {
        sample.ipAddress = parseHostnameIOutput(hostnameI.output);
    }
    if (sample.ipAddress.empty()) {
        const CommandResult route = runCommand(QStringLiteral("ip"),
                                               {QStringLiteral("route"),
                                                QStringLiteral("get"),
                                                QStringLiteral("1")},
                                               kIpTimeoutMs);
        if (route.exitCode == 0) {
            sample.ipAddress = parseIpRouteOutput(route.output);
        }
    }

    const CommandResult top = runCommand(QStringLiteral("top"),
                                         {QStringLiteral("-b"),
                                          QStringLiteral("-n"),
                                          QStringLiteral("1")},
                                         kTopTimeoutMs);
    if (top.exitCode == 0) {
        const TopSummary summary = parseTopSummary(top.output);
        sample.cpuInfo = summary.cpuInfo;
        sample.memoryInfo = summary.memoryInfo;
        sample.swapInfo = summary.swapInfo;
    } else {
        CMLOG_DEBUG(QStringLiteral("CommandHostSampler"),
                    QStringLiteral("sample"),
                    QStringLiteral("top_unavailable"),
                    QStringLiteral("command_failed"),
                    QString(),
                    (nlohmann::json{{"exitCode", top.exitCode}}));
    }

    return sample;
}

TopSummary parseTopSummary(const QString &topOutput)
{
    TopSummary summary;

    // Only the header block matters; the process table follows it.
    const QStringList lines = topOutput.split('\n');
    const int limit = std::min<int>(lines.size(), 10);
    for (int i = 0; i < limit; ++i) {
        QString line = lines.at(i);
        if (line.endsWith('\r')) {
            line.chop(1);
        }

        if (summary.cpuInfo.empty() && line.startsWith(QStringLiteral("%Cpu"))) {
            summary.cpuInfo = line.toStdString();
        } else if (summary.memoryInfo.empty() && line.contains(QStringLiteral("Mem :"))) {
            summary.memoryInfo = line.toStdString();
        } else if (summary.swapInfo.empty() && line.contains(QStringLiteral("Swap:"))) {
            summary.swapInfo = line.toStdString();
        }
    }

    return summary;
}

std::string parseHostnameIOutput(const QString &output)
{
    const QStringList tokens = output.simplified().split(' ', Qt::SkipEmptyParts);
    if (tokens.isEmpty()) {
        return {};
    }
    return tokens.first().toStdString();
}

std::string parseIpRouteOutput(const QString &output)
{
    const QStringList tokens = output.simplified().split(' ', Qt::SkipEmptyParts);
    const auto src = tokens.indexOf(QStringLiteral("src"));
    if (src < 0 || src + 1 >= tokens.size()) {
        return {};
    }
    return tokens.at(src + 1).toStdString();
}

} // namespace contmon
