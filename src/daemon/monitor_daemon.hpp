#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

#include <QObject>

#include "common/models.hpp"
#include "daemon/checkpoint_store.hpp"
#include "daemon/collectors.hpp"
#include "daemon/monitor_config.hpp"
#include "daemon/snapshot_publisher.hpp"

class QTimer;

namespace contmon {

struct Collectors {
    std::unique_ptr<BootIdSource> bootIds;
    std::unique_ptr<LogSource> logs;
    std::unique_ptr<HostSampler> host;
};

// Real system collectors; logs come from dumpPath when it is not empty.
Collectors systemCollectors(const QString &dumpPath = QString());

using WallClock = std::function<std::chrono::system_clock::time_point()>;

struct CycleReport {
    uint64_t cycle = 0;
    bool rebootDetected = false;
    size_t newEntryCount = 0;
    Checkpoint checkpoint;
    bool checkpointSaved = false;
    bool published = false;
};

/**
 * MonitorDaemon runs the polling loop:
 * - load the checkpoint and reset it when the boot id changed
 * - read the whole ring buffer and extract the entries past the watermark
 * - persist the advanced watermark
 * - sample the host, assemble the snapshot and publish it
 *
 * Cycles are driven by a QTimer once start() is called; runCycle() can also be
 * called directly, which is how tests run many cycles without waiting.
 */
class MonitorDaemon : public QObject
{
    Q_OBJECT
public:
    MonitorDaemon(MonitorConfig config,
                  CheckpointStore &store,
                  Collectors collectors,
                  QObject *parent = nullptr);
    ~MonitorDaemon() override;

    void setWallClock(WallClock clock);

    // Runs one cycle immediately, then one per configured interval.
    void start();
    void stop();

    CycleReport runCycle();

    std::optional<MonitorSnapshot> latestSnapshot() const;
    Checkpoint currentCheckpoint() const;
    uint64_t cycleCount() const;

signals:
    void cycleFinished();

private slots:
    void onTimerTimeout();

private:
    Checkpoint loadCheckpoint();
    bool persistCheckpoint(const Checkpoint &checkpoint);

    MonitorConfig m_config;
    CheckpointStore &m_store;
    Collectors m_collectors;
    SnapshotPublisher m_publisher;
    WallClock m_clock;
    QTimer *m_timer = nullptr;

    uint64_t m_cycleCount = 0;
    Checkpoint m_checkpoint;
    // Set while the store holds an older watermark than m_checkpoint.
    bool m_checkpointDirty = false;
    std::optional<MonitorSnapshot> m_latestSnapshot;
};

} // namespace contmon
