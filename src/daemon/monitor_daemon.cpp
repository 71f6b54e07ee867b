#include "daemon/monitor_daemon.hpp"

#include <chrono>
#include <utility>

#include <QDateTime>
#include <QDebug>
#include <QTimer>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "daemon/kmsg_parser.hpp"
#include "daemon/reboot_detector.hpp"
#include "daemon/snapshot_assembler.hpp"

namespace contmon {

Collectors systemCollectors(const QString &dumpPath)
{
    Collectors collectors;
    collectors.bootIds = std::make_unique<ProcBootIdSource>();
    if (dumpPath.isEmpty()) {
        collectors.logs = std::make_unique<DmesgLogSource>();
    } else {
        collectors.logs = std::make_unique<FileLogSource>(dumpPath);
    }
    collectors.host = std::make_unique<CommandHostSampler>();
    return collectors;
}

MonitorDaemon::MonitorDaemon(MonitorConfig config,
                             CheckpointStore &store,
                             Collectors collectors,
                             QObject *parent)
    : QObject(parent)
    , m_config(std::move(config))
    , m_store(store)
    , m_collectors(std::move(collectors))
    , m_publisher(m_config.outputPath)
    , m_clock([] { return std::chrono::system_clock::now(); })
{
}

MonitorDaemon::~MonitorDaemon() = default;

void MonitorDaemon::setWallClock(WallClock clock)
{
    m_clock = std::move(clock);
}

void MonitorDaemon::start()
{
    qInfo() << "Starting continuous monitoring (Ctrl+C to stop)...";
    CMLOG_INFO(QStringLiteral("MonitorDaemon"),
               QStringLiteral("start"),
               QStringLiteral("monitor_start"),
               QString(),
               QString(),
               (nlohmann::json{{"intervalSeconds", m_config.intervalSeconds},
                               {"output", m_config.outputPath.toStdString()},
                               {"db", m_store.databasePath().string()}}));

    if (!m_timer) {
        m_timer = new QTimer(this);
        const qint64 seconds = qBound<qint64>(1, m_config.intervalSeconds, kMaxIntervalSeconds);
        m_timer->setInterval(std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::seconds(seconds)));
        connect(m_timer, &QTimer::timeout, this, &MonitorDaemon::onTimerTimeout);
    }

    runCycle();
    m_timer->start();
}

void MonitorDaemon::stop()
{
    if (m_timer) {
        m_timer->stop();
    }
}

void MonitorDaemon::onTimerTimeout()
{
    runCycle();
}

Checkpoint MonitorDaemon::loadCheckpoint()
{
    // The store lags behind after a failed save; keep using the newer value.
    if (m_checkpointDirty) {
        return m_checkpoint;
    }
    return m_store.load();
}

bool MonitorDaemon::persistCheckpoint(const Checkpoint &checkpoint)
{
    try {
        m_store.save(checkpoint);
        m_checkpointDirty = false;
        return true;
    } catch (const std::exception &ex) {
        m_checkpointDirty = true;
        qWarning() << "contmon: failed to persist checkpoint:" << ex.what();
        CMLOG_WARN(QStringLiteral("MonitorDaemon"),
                   QStringLiteral("persistCheckpoint"),
                   QStringLiteral("checkpoint_save_failed"),
                   QString::fromUtf8(ex.what()),
                   QString(),
                   nlohmann::json(checkpoint));
        return false;
    }
}

CycleReport MonitorDaemon::runCycle()
{
    ++m_cycleCount;
    logging::CorrelationScope corrScope(QStringLiteral("cycle-%1").arg(m_cycleCount));

    CycleReport report;
    report.cycle = m_cycleCount;

    const Checkpoint stored = loadCheckpoint();
    const RebootCheckResult reboot =
        checkAndMaybeReset(m_collectors.bootIds->currentBootId(), stored);
    report.rebootDetected = reboot.resetOccurred;
    if (reboot.resetOccurred) {
        qInfo() << "System reboot detected (Boot ID changed). Resetting dmesg timestamp.";
        CMLOG_INFO(QStringLiteral("MonitorDaemon"),
                   QStringLiteral("runCycle"),
                   QStringLiteral("reboot_detected"),
                   QStringLiteral("boot_id_changed"),
                   QString(),
                   (nlohmann::json{{"previousBootId", stored.bootId},
                                   {"currentBootId", reboot.checkpoint.bootId},
                                   {"previousOffset", formatBootOffset(stored.lastLogOffset)}}));
    }

    const LogBatch batch = m_collectors.logs->readBuffer();
    const ExtractionResult extraction =
        extractNewEntries(batch, reboot.checkpoint.lastLogOffset);

    Checkpoint next = reboot.checkpoint;
    next.lastLogOffset = extraction.newOffset;
    const bool advanced = extraction.newOffset > reboot.checkpoint.lastLogOffset;

    m_checkpoint = next;
    if (advanced || reboot.resetOccurred || m_checkpointDirty) {
        report.checkpointSaved = persistCheckpoint(next);
    }
    report.checkpoint = next;
    report.newEntryCount = extraction.newEntries.size();

    const HostSample host = m_collectors.host->sample();
    const auto now = m_clock();
    MonitorSnapshot snapshot = assembleSnapshot(host, extraction, now);

    QString publishError;
    report.published = m_publisher.publish(snapshot, &publishError);
    if (report.published) {
        const QString clock = QDateTime::fromSecsSinceEpoch(
                                  std::chrono::system_clock::to_time_t(now))
                                  .toString(QStringLiteral("HH:mm:ss"));
        qInfo().noquote() << QStringLiteral("[%1] Updated %2").arg(clock, m_publisher.outputPath());
    } else {
        qWarning() << "contmon: failed to publish snapshot:" << publishError;
        CMLOG_WARN(QStringLiteral("MonitorDaemon"),
                   QStringLiteral("runCycle"),
                   QStringLiteral("snapshot_publish_failed"),
                   publishError,
                   QString(),
                   (nlohmann::json{{"output", m_publisher.outputPath().toStdString()}}));
    }
    m_latestSnapshot = std::move(snapshot);

    CMLOG_DEBUG(QStringLiteral("MonitorDaemon"),
                QStringLiteral("runCycle"),
                QStringLiteral("cycle_complete"),
                QString(),
                QString(),
                (nlohmann::json{{"bufferEntries", batch.size()},
                                {"newEntries", report.newEntryCount},
                                {"checkpoint", nlohmann::json(next)},
                                {"checkpointSaved", report.checkpointSaved},
                                {"published", report.published}}));

    emit cycleFinished();
    return report;
}

std::optional<MonitorSnapshot> MonitorDaemon::latestSnapshot() const
{
    return m_latestSnapshot;
}

Checkpoint MonitorDaemon::currentCheckpoint() const
{
    return m_checkpoint;
}

uint64_t MonitorDaemon::cycleCount() const
{
    return m_cycleCount;
}

} // namespace contmon
