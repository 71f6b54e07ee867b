#include "daemon/monitor_config.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QList>
#include <QStandardPaths>

#include <unistd.h>

#include <utility>

#include "common/json_utils.hpp"
#include "daemon/checkpoint_store.hpp"

namespace contmon {

namespace {

std::optional<qint64> parseNonNegative(const QString &text)
{
    bool ok = false;
    const qint64 value = text.trimmed().toLongLong(&ok);
    if (!ok || value < 0) {
        return std::nullopt;
    }
    return value;
}

bool validInterval(qint64 seconds)
{
    return seconds > 0 && seconds <= kMaxIntervalSeconds;
}

QString intervalError(const QString &source)
{
    return QStringLiteral("%1 must be between 1 and %2 seconds").arg(source).arg(kMaxIntervalSeconds);
}

} // namespace

QString defaultSocketPath()
{
    const QString socketName = qEnvironmentVariable("CONTMON_SOCKET_NAME");
    if (!socketName.isEmpty()) {
        return socketName;
    }

    QString runtimeDir = qEnvironmentVariable("XDG_RUNTIME_DIR");
    if (runtimeDir.isEmpty()) {
        runtimeDir =
            QStandardPaths::writableLocation(QStandardPaths::RuntimeLocation);
    }
    if (runtimeDir.isEmpty()) {
        runtimeDir = QStringLiteral("/run/user/%1").arg(getuid());
    }
    return runtimeDir + QStringLiteral("/contmon.sock");
}

ConfigResult parseMonitorConfig(const QStringList &args)
{
    ConfigResult result;
    MonitorConfig &config = result.config;

    config.stateDir = QString::fromStdString(CheckpointStore::defaultStateDir().string());
    config.socketPath = defaultSocketPath();

    if (qEnvironmentVariableIsSet("CONTMON_INTERVAL")) {
        const auto interval = parseNonNegative(qEnvironmentVariable("CONTMON_INTERVAL"));
        if (!interval.has_value() || !validInterval(*interval)) {
            result.ok = false;
            result.error = intervalError(QStringLiteral("CONTMON_INTERVAL"));
            return result;
        }
        config.intervalSeconds = static_cast<int>(*interval);
    }
    if (qEnvironmentVariableIsSet("CONTMON_OUTPUT")) {
        config.outputPath = qEnvironmentVariable("CONTMON_OUTPUT");
    }
    if (qEnvironmentVariableIsSet("CONTMON_STATE_DIR")) {
        config.stateDir = qEnvironmentVariable("CONTMON_STATE_DIR");
    }
    config.dmesgDumpPath = qEnvironmentVariable("CONTMON_DMESG_PATH");
    config.serveSocket = qEnvironmentVariableIntValue("CONTMON_SERVE") == 1;
    config.traceEnabled = qEnvironmentVariableIntValue("CONTMON_TRACE") == 1;

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Publish host metrics and new kernel ring-buffer lines as a JSON snapshot."));
    const QCommandLineOption helpOption = parser.addHelpOption();
    QCommandLineOption intervalOption(QStringList() << "i" << "interval",
                                      "Seconds between cycles (default 5).",
                                      "seconds");
    QCommandLineOption minOption(QStringList() << "min",
                                 "Interval minutes, added to --sec.",
                                 "minutes");
    QCommandLineOption secOption(QStringList() << "sec",
                                 "Interval seconds, added to --min.",
                                 "seconds");
    QCommandLineOption outputOption(QStringList() << "o" << "output",
                                    "Snapshot file to overwrite every cycle.",
                                    "file");
    QCommandLineOption stateDirOption(QStringList() << "state-dir",
                                      "Directory holding the checkpoint database.",
                                      "dir");
    QCommandLineOption serveOption(QStringList() << "serve",
                                   "Serve the latest snapshot on a local socket.");
    QCommandLineOption socketOption(QStringList() << "socket",
                                    "Local socket name or path for --serve.",
                                    "path");
    QCommandLineOption traceOption(QStringList() << "trace",
                                   "Enable verbose trace logging.");
    QCommandLineOption onceOption(QStringList() << "once",
                                  "Run a single cycle and exit.");
    QCommandLineOption sinceOption(QStringList() << "dmesg-since",
                                   "Print kernel lines newer than the given seconds since boot and exit.",
                                   "seconds");
    QCommandLineOption dmesgOption(QStringList() << "dmesg",
                                   "Print the whole kernel ring buffer and exit.");
    QCommandLineOption processesOption(QStringList() << "processes",
                                       "Print processes with many threads as JSON and exit.");
    QCommandLineOption checkThreadsOption(QStringList() << "check-threads",
                                          "Print the process with the most threads as JSON and exit.");
    QCommandLineOption metricsOption(QStringList() << "metrics",
                                     "Print one host metrics sample as JSON and exit.");
    parser.addOption(intervalOption);
    parser.addOption(minOption);
    parser.addOption(secOption);
    parser.addOption(outputOption);
    parser.addOption(stateDirOption);
    parser.addOption(serveOption);
    parser.addOption(socketOption);
    parser.addOption(traceOption);
    parser.addOption(onceOption);
    parser.addOption(sinceOption);
    parser.addOption(dmesgOption);
    parser.addOption(processesOption);
    parser.addOption(checkThreadsOption);
    parser.addOption(metricsOption);

    if (!parser.parse(args)) {
        result.ok = false;
        result.error = parser.errorText();
        return result;
    }

    if (parser.isSet(helpOption)) {
        result.helpRequested = true;
        result.helpText = parser.helpText();
        return result;
    }

    if (parser.isSet(intervalOption)) {
        const auto interval = parseNonNegative(parser.value(intervalOption));
        if (!interval.has_value() || !validInterval(*interval)) {
            result.ok = false;
            result.error = intervalError(QStringLiteral("--interval"));
            return result;
        }
        config.intervalSeconds = static_cast<int>(*interval);
    } else if (parser.isSet(minOption) || parser.isSet(secOption)) {
        const auto minutes = parser.isSet(minOption)
            ? parseNonNegative(parser.value(minOption))
            : std::optional<qint64>(0);
        const auto seconds = parser.isSet(secOption)
            ? parseNonNegative(parser.value(secOption))
            : std::optional<qint64>(0);
        if (!minutes.has_value() || !seconds.has_value()
            || (*minutes == 0 && *seconds == 0)) {
            result.ok = false;
            result.error = QStringLiteral("Please specify an interval using --min or --sec");
            return result;
        }
        // Bound the minutes first so the sum cannot overflow.
        if (*minutes > kMaxIntervalSeconds / 60 || !validInterval(*minutes * 60 + *seconds)) {
            result.ok = false;
            result.error = intervalError(QStringLiteral("--min/--sec"));
            return result;
        }
        config.intervalSeconds = static_cast<int>(*minutes * 60 + *seconds);
    }

    if (parser.isSet(outputOption)) {
        config.outputPath = parser.value(outputOption);
    }
    if (parser.isSet(stateDirOption)) {
        config.stateDir = parser.value(stateDirOption);
    }
    if (parser.isSet(serveOption)) {
        config.serveSocket = true;
    }
    if (parser.isSet(socketOption)) {
        config.socketPath = parser.value(socketOption);
    }
    if (parser.isSet(traceOption)) {
        config.traceEnabled = true;
    }
    if (parser.isSet(onceOption)) {
        config.runOnce = true;
    }
    const QList<std::pair<const QCommandLineOption *, OneShotMode>> modes = {
        {&dmesgOption, OneShotMode::Dmesg},
        {&sinceOption, OneShotMode::Dmesg},
        {&processesOption, OneShotMode::Processes},
        {&checkThreadsOption, OneShotMode::CheckThreads},
        {&metricsOption, OneShotMode::Metrics},
    };
    for (const auto &[option, mode] : modes) {
        if (!parser.isSet(*option)) {
            continue;
        }
        if (config.oneShot != OneShotMode::None && config.oneShot != mode) {
            result.ok = false;
            result.error =
                QStringLiteral("Choose only one of --dmesg, --processes, --check-threads, --metrics");
            return result;
        }
        config.oneShot = mode;
    }

    if (parser.isSet(sinceOption)) {
        config.dmesgSince = parseBootOffset(parser.value(sinceOption).toStdString());
        if (!config.dmesgSince.has_value()) {
            result.ok = false;
            result.error = QStringLiteral("--dmesg-since expects seconds since boot, e.g. 4.5");
            return result;
        }
    }

    if (config.outputPath.isEmpty()) {
        result.ok = false;
        result.error = QStringLiteral("output path must not be empty");
        return result;
    }

    return result;
}

} // namespace contmon
