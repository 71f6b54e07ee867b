#include <QCoreApplication>
#include <QDateTime>
#include <QDebug>

#include <chrono>
#include <cstdio>
#include <exception>
#include <memory>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "daemon/checkpoint_store.hpp"
#include "daemon/kmsg_parser.hpp"
#include "daemon/monitor_config.hpp"
#include "daemon/monitor_daemon.hpp"
#include "daemon/proc_inventory.hpp"
#include "daemon/snapshot_server.hpp"

namespace {

using namespace std::chrono_literals;

constexpr auto kProcessSampleWindow = 200ms;
constexpr auto kCpuSampleWindow = 200ms;
constexpr auto kNetSampleWindow = 100ms;

void printReport(const nlohmann::json &report)
{
    std::printf("%s\n", contmon::dumpReport(report).c_str());
}

// Whole buffer, or only lines strictly newer than --dmesg-since.
int printDmesg(const contmon::MonitorConfig &config)
{
    contmon::Collectors collectors = contmon::systemCollectors(config.dmesgDumpPath);
    const contmon::LogBatch batch = collectors.logs->readBuffer();
    const std::string text = config.dmesgSince.has_value()
        ? contmon::joinEntries(contmon::extractNewEntries(batch, *config.dmesgSince).newEntries)
        : contmon::joinEntries(batch);
    if (!text.empty()) {
        std::printf("%s\n", text.c_str());
    }
    return 0;
}

int printInventory(const contmon::MonitorConfig &config)
{
    contmon::ProcInventory inventory;
    const std::string serverId = contmon::localServerId();
    const int64_t now = QDateTime::currentMSecsSinceEpoch();

    nlohmann::json report = nlohmann::json::array();
    switch (config.oneShot) {
    case contmon::OneShotMode::Processes:
        for (const contmon::ProcessInfo &process :
             inventory.collectProcesses(serverId, now, kProcessSampleWindow)) {
            report.push_back(nlohmann::json(process));
        }
        break;
    case contmon::OneShotMode::CheckThreads:
        if (const auto busiest = inventory.maxThreadsProcess(serverId, now, kProcessSampleWindow)) {
            report.push_back(nlohmann::json(*busiest));
        }
        break;
    case contmon::OneShotMode::Metrics:
        report.push_back(
            nlohmann::json(inventory.collectMetrics(serverId, now, kCpuSampleWindow, kNetSampleWindow)));
        break;
    case contmon::OneShotMode::None:
    case contmon::OneShotMode::Dmesg:
        return 2;
    }

    printReport(report);
    return 0;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("contmon-daemon"));

    const contmon::ConfigResult parsed = contmon::parseMonitorConfig(app.arguments());
    if (parsed.helpRequested) {
        std::printf("%s", parsed.helpText.toLocal8Bit().constData());
        return 0;
    }
    if (!parsed.ok) {
        std::fprintf(stderr, "contmon-daemon: %s\n", parsed.error.toLocal8Bit().constData());
        return 2;
    }
    const contmon::MonitorConfig &config = parsed.config;

    contmon::logging::initLogging(QStringLiteral("contmon-daemon"), config.traceEnabled);
    CMLOG_INFO(QStringLiteral("main"),
               QStringLiteral("main"),
               QStringLiteral("daemon_start"),
               QStringLiteral("user_start"),
               QString(),
               (nlohmann::json{{"intervalSeconds", config.intervalSeconds},
                               {"once", config.runOnce},
                               {"oneShot", static_cast<int>(config.oneShot)},
                               {"serve", config.serveSocket}}));

    if (config.oneShot == contmon::OneShotMode::Dmesg) {
        return printDmesg(config);
    }
    if (config.oneShot != contmon::OneShotMode::None) {
        return printInventory(config);
    }

    // The only fatal condition: without a checkpoint store nothing can be tracked.
    std::unique_ptr<contmon::CheckpointStore> store;
    try {
        store = std::make_unique<contmon::CheckpointStore>(config.stateDir.toStdString());
    } catch (const std::exception &ex) {
        std::fprintf(stderr, "contmon-daemon: cannot open checkpoint store in %s: %s\n",
                     config.stateDir.toLocal8Bit().constData(), ex.what());
        CMLOG_ERROR(QStringLiteral("main"),
                    QStringLiteral("main"),
                    QStringLiteral("checkpoint_store_unavailable"),
                    QString::fromUtf8(ex.what()),
                    QString(),
                    (nlohmann::json{{"stateDir", config.stateDir.toStdString()}}));
        return 1;
    }

    contmon::MonitorDaemon daemon(config, *store,
                                  contmon::systemCollectors(config.dmesgDumpPath));

    if (config.runOnce) {
        const contmon::CycleReport report = daemon.runCycle();
        return report.published ? 0 : 1;
    }

    std::unique_ptr<contmon::SnapshotServer> server;
    if (config.serveSocket) {
        server = std::make_unique<contmon::SnapshotServer>(daemon);
        if (!server->start(config.socketPath)) {
            qWarning() << "contmon: snapshot server disabled";
            server.reset();
        }
    }

    daemon.start();

    return app.exec();
}
