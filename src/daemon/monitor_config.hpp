#pragma once

#include <limits>
#include <optional>

#include <QString>
#include <QStringList>

#include "common/models.hpp"

namespace contmon {

// Longest cycle interval whose millisecond value still fits a QTimer interval.
constexpr qint64 kMaxIntervalSeconds = std::numeric_limits<int>::max() / 1000;

// Commands that print one report to stdout and exit instead of looping.
enum class OneShotMode {
    None,
    Dmesg,
    Processes,
    CheckThreads,
    Metrics,
};

struct MonitorConfig {
    int intervalSeconds = 5;
    QString outputPath = QStringLiteral("continuous_monitor.json");
    QString stateDir;
    QString dmesgDumpPath;
    bool serveSocket = false;
    QString socketPath;
    bool traceEnabled = false;
    bool runOnce = false;
    OneShotMode oneShot = OneShotMode::None;
    // With OneShotMode::Dmesg, only lines newer than this offset are printed.
    std::optional<BootOffset> dmesgSince;
};

struct ConfigResult {
    MonitorConfig config;
    bool ok = true;
    bool helpRequested = false;
    QString error;
    QString helpText;
};

/**
 * Build the daemon configuration. Defaults are overridden by CONTMON_*
 * environment variables, which are in turn overridden by command-line flags.
 * args[0] is the program name, as in QCoreApplication::arguments().
 */
ConfigResult parseMonitorConfig(const QStringList &args);

// $XDG_RUNTIME_DIR/contmon.sock, or CONTMON_SOCKET_NAME when set.
QString defaultSocketPath();

} // namespace contmon
