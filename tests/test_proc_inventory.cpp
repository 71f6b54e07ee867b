#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "daemon/proc_inventory.hpp"

namespace {

using namespace std::chrono_literals;

constexpr long kTicks = 100;

void writeFile(const QString &path, const QByteArray &content)
{
    QDir().mkpath(QFileInfo(path).path());
    QFile file(path);
    if (file.open(QIODevice::WriteOnly)) {
        file.write(content);
    }
}

QByteArray statLine(int pid, const QByteArray &comm, char state, quint64 utime, quint64 stime,
                     int priority, int nice, int threads, quint64 startTime)
{
    const QByteArrayList fields{
        QByteArray::number(pid), "(" + comm + ")", QByteArray(1, state),
        "1", "1", "1", "0", "-1", "4194560", "0", "0", "0", "0",
        QByteArray::number(utime), QByteArray::number(stime), "0", "0",
        QByteArray::number(priority), QByteArray::number(nice), QByteArray::number(threads),
        "0", QByteArray::number(startTime), "1048576", "100"};
    return fields.join(' ') + '\n';
}

QByteArray statusText(int uid, quint64 vmSizeKb, quint64 vmRssKb)
{
    return QByteArray("Name:\tsomething\nState:\tS (sleeping)\n")
        + "Uid:\t" + QByteArray::number(uid) + "\t" + QByteArray::number(uid) + "\t0\t0\n"
        + "VmSize:\t " + QByteArray::number(vmSizeKb) + " kB\n"
        + "VmRSS:\t " + QByteArray::number(vmRssKb) + " kB\n";
}

const char *kMemInfo =
    "MemTotal:        1000000 kB\n"
    "MemFree:          100000 kB\n"
    "MemAvailable:     250000 kB\n"
    "Buffers:           10000 kB\n";

const char *kCpuStat =
    "cpu  100 0 100 700 100 0 0 0 0 0\n"
    "cpu0 50 0 50 350 50 0 0 0 0 0\n"
    "intr 12345\n";

const char *kDiskStats =
    "   8       0 sda 100 0 2048 10 200 0 4096 20 0 30 30 0 0 0 0\n"
    "   8       1 sda1 90 0 1024 10 100 0 2048 20 0 30 30 0 0 0 0\n"
    " 259       0 nvme0n1 5 0 999999 1 5 0 999999 1 0 2 2 0 0 0 0\n"
    "   7       0 loop0 1 2 3\n";

const char *kNetDev =
    "Inter-|   Receive                                                |  Transmit\n"
    " face |bytes    packets errs drop fifo frame compressed multicast|bytes    packets errs drop fifo colls carrier compressed\n"
    "    lo:    2048      10    0    0    0     0          0         0     2048      10    0    0    0     0       0          0\n"
    "  eth0: 1048576     100    0    0    0     0          0         0   524288      50    0    0    0     0       0          0\n";

} // namespace

class ProcInventoryTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void testParseProcStat();
    void testParseProcStatRejectsGarbage();
    void testParseProcStatus();
    void testCpuTimes();
    void testParseMemInfo();
    void testParseDiskStatsSkipsPartitions();
    void testParseNetDev();
    void testFormatMemory();
    void testFormatRuntime();
    void testProcessStateName();
    void testServerId();
    void testDiskUsagePercent();
    void testUserNameForUid();
    void testCollectProcessesFiltersByThreadCount();
    void testThreadDetailsCappedAndOrdered();
    void testMaxThreadsProcess();
    void testMaxThreadsProcessEmptyTree();
    void testCollectMetrics();
    void testReportJsonKeys();

private:
    QTemporaryDir m_tempDir;
    QString m_procRoot;
};

void ProcInventoryTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_procRoot = m_tempDir.path() + "/proc";
    qputenv("CONTMON_LOG_DIR", (m_tempDir.path() + "/logs").toUtf8());

    writeFile(m_procRoot + "/meminfo", kMemInfo);
    writeFile(m_procRoot + "/uptime", "5000.50 1234.00\n");
    writeFile(m_procRoot + "/stat", kCpuStat);
    writeFile(m_procRoot + "/diskstats", kDiskStats);
    writeFile(m_procRoot + "/net/dev", kNetDev);
    QVERIFY(QDir().mkpath(m_procRoot + "/self"));
    QVERIFY(QDir().mkpath(m_procRoot + "/sys/kernel"));

    writeFile(m_procRoot + "/100/stat", statLine(100, "pool worker", 'S', 10, 5, 20, 0, 25, 500));
    writeFile(m_procRoot + "/100/status", statusText(0, 524288, 250000));
    for (int tid : {101, 100}) {
        const QString dir = m_procRoot + "/100/task/" + QString::number(tid);
        writeFile(dir + "/stat", statLine(tid, "pool worker", 'S', 1, 1, 20, 0, 25, 500));
        writeFile(dir + "/status", statusText(0, 524288, 250000));
    }

    writeFile(m_procRoot + "/200/stat", statLine(200, "small", 'R', 1, 1, 20, 0, 5, 600));
    writeFile(m_procRoot + "/200/status", statusText(0, 1024, 512));

    writeFile(m_procRoot + "/300/stat", statLine(300, "busy (main)", 'S', 40, 20, 10, -10, 40, 100000));
    writeFile(m_procRoot + "/300/status", statusText(0, 2097152, 100000));
    for (int tid = 300; tid < 312; ++tid) {
        const QString dir = m_procRoot + "/300/task/" + QString::number(tid);
        const char state = tid == 301 ? 'R' : 'S';
        writeFile(dir + "/stat", statLine(tid, "busy-" + QByteArray::number(tid), state, 1, 1, 10, -10, 40, 100000));
        writeFile(dir + "/status", statusText(0, 2097152, 2048));
    }

    // Same thread count as 300 but a higher pid; no status file.
    writeFile(m_procRoot + "/400/stat", statLine(400, "twin", 'D', 0, 0, 20, 0, 40, 700));
}

void ProcInventoryTests::testParseProcStat()
{
    const auto stat = contmon::parseProcStat(
        statLine(42, "a) (b", 'S', 123, 45, 39, -19, 31, 98765));
    QVERIFY(stat.has_value());
    QCOMPARE(stat->pid, 42);
    QCOMPARE(QString::fromStdString(stat->comm), QStringLiteral("a) (b"));
    QCOMPARE(stat->state, 'S');
    QCOMPARE(stat->utime, uint64_t(123));
    QCOMPARE(stat->stime, uint64_t(45));
    QCOMPARE(stat->priority, int64_t(39));
    QCOMPARE(stat->nice, int64_t(-19));
    QCOMPARE(stat->numThreads, int64_t(31));
    QCOMPARE(stat->startTime, uint64_t(98765));
}

void ProcInventoryTests::testParseProcStatRejectsGarbage()
{
    QVERIFY(!contmon::parseProcStat(QByteArray()).has_value());
    QVERIFY(!contmon::parseProcStat("12 no parens here\n").has_value());
    QVERIFY(!contmon::parseProcStat("12 (short) S 1 2 3\n").has_value());
    QVERIFY(!contmon::parseProcStat("(x) S 1 1 1 0 -1 0 0 0 0 0 1 1 0 0 20 0 1 0 1 1 1\n")
                 .has_value());

    QByteArray corrupt = statLine(7, "bad", 'S', 1, 1, 20, 0, 1, 1);
    corrupt.replace(" 20 0 1 ", " 20 zero 1 ");
    QVERIFY(!contmon::parseProcStat(corrupt).has_value());
}

void ProcInventoryTests::testParseProcStatus()
{
    const contmon::ProcStatus status = contmon::parseProcStatus(statusText(1000, 4096, 2048));
    QCOMPARE(status.uid.value_or(0), uint32_t(1000));
    QCOMPARE(status.vmSizeKb.value_or(0), uint64_t(4096));
    QCOMPARE(status.vmRssKb.value_or(0), uint64_t(2048));

    // Kernel threads have no Vm* lines.
    const contmon::ProcStatus kernel = contmon::parseProcStatus("Name:\tkthreadd\nUid:\t0\t0\t0\t0\n");
    QVERIFY(kernel.uid.has_value());
    QVERIFY(!kernel.vmSizeKb.has_value());
    QVERIFY(!kernel.vmRssKb.has_value());
}

void ProcInventoryTests::testCpuTimes()
{
    const auto before = contmon::parseCpuTimes(kCpuStat);
    QVERIFY(before.has_value());
    QCOMPARE(before->total, uint64_t(1000));
    QCOMPARE(before->busy, uint64_t(200));

    const auto after = contmon::parseCpuTimes("cpu  130 0 120 740 110 0 0 0 0 0\n");
    QVERIFY(after.has_value());
    // 50 busy ticks out of 100.
    QCOMPARE(contmon::cpuBusyPercent(*before, *after), 50.0);
    QCOMPARE(contmon::cpuBusyPercent(*before, *before), 0.0);

    QVERIFY(!contmon::parseCpuTimes("cpu0 1 2 3 4\n").has_value());
    QVERIFY(!contmon::parseCpuTimes("cpu  1 x 3 4\n").has_value());
}

void ProcInventoryTests::testParseMemInfo()
{
    const contmon::MemInfo info = contmon::parseMemInfo(kMemInfo);
    QCOMPARE(info.totalKb, uint64_t(1000000));
    QCOMPARE(info.availableKb, uint64_t(250000));

    const contmon::MemInfo empty = contmon::parseMemInfo(QByteArray());
    QCOMPARE(empty.totalKb, uint64_t(0));
}

void ProcInventoryTests::testParseDiskStatsSkipsPartitions()
{
    const contmon::DiskIo io = contmon::parseDiskStats(kDiskStats);
    // Only sda: sda1 is a partition and nvme0n1 ends in a digit as well.
    QCOMPARE(io.readSectors, uint64_t(2048));
    QCOMPARE(io.writeSectors, uint64_t(4096));
}

void ProcInventoryTests::testParseNetDev()
{
    const contmon::NetCounters counters = contmon::parseNetDev(kNetDev);
    QCOMPARE(counters.rxBytes, uint64_t(2048 + 1048576));
    QCOMPARE(counters.txBytes, uint64_t(2048 + 524288));
}

void ProcInventoryTests::testFormatMemory()
{
    QCOMPARE(QString::fromStdString(contmon::formatMemory(0)), QStringLiteral("0K"));
    QCOMPARE(QString::fromStdString(contmon::formatMemory(512)), QStringLiteral("512K"));
    QCOMPARE(QString::fromStdString(contmon::formatMemory(1024)), QStringLiteral("1M"));
    QCOMPARE(QString::fromStdString(contmon::formatMemory(1048575)), QStringLiteral("1023M"));
    QCOMPARE(QString::fromStdString(contmon::formatMemory(1048576)), QStringLiteral("1G"));
    QCOMPARE(QString::fromStdString(contmon::formatMemory(3 * 1048576 + 5)), QStringLiteral("3G"));
}

void ProcInventoryTests::testFormatRuntime()
{
    QCOMPARE(QString::fromStdString(contmon::formatRuntime(0)), QStringLiteral("0:00:00"));
    QCOMPARE(QString::fromStdString(contmon::formatRuntime(3725)), QStringLiteral("1:02:05"));
    QCOMPARE(QString::fromStdString(contmon::formatRuntime(360000)), QStringLiteral("100:00:00"));
}

void ProcInventoryTests::testProcessStateName()
{
    QCOMPARE(QString::fromStdString(contmon::processStateName('R')), QStringLiteral("Running"));
    QCOMPARE(QString::fromStdString(contmon::processStateName('S')), QStringLiteral("Sleeping"));
    QCOMPARE(QString::fromStdString(contmon::processStateName('D')), QStringLiteral("Waiting"));
    QCOMPARE(QString::fromStdString(contmon::processStateName('Z')), QStringLiteral("Zombie"));
    QCOMPARE(QString::fromStdString(contmon::processStateName('I')), QStringLiteral("Idle"));
    QCOMPARE(QString::fromStdString(contmon::processStateName('?')), QStringLiteral("Unknown"));
}

void ProcInventoryTests::testServerId()
{
    QCOMPARE(QString::fromStdString(contmon::makeServerId("web01", "0123456789abcdef")),
             QStringLiteral("web01-01234567"));
    QCOMPARE(QString::fromStdString(contmon::makeServerId("h", "abc")), QStringLiteral("h-abc"));
    QCOMPARE(QString::fromStdString(contmon::makeServerId("", "")),
             QStringLiteral("unknown-unknown"));
    QVERIFY(!contmon::localServerId().empty());
}

void ProcInventoryTests::testDiskUsagePercent()
{
    QCOMPARE(contmon::diskUsagePercent({}), 0.0);
    QCOMPARE(contmon::diskUsagePercent({{1000, 250}, {1000, 750}}), 50.0);
    // Zero-sized pseudo volumes are ignored.
    QCOMPARE(contmon::diskUsagePercent({{0, 0}, {400, 100}}), 75.0);

    QCOMPARE(contmon::roundToTenth(33.333), 33.3);
    QCOMPARE(contmon::roundToTenth(66.66), 66.7);
}

void ProcInventoryTests::testUserNameForUid()
{
    QCOMPARE(QString::fromStdString(contmon::userNameForUid(0)), QStringLiteral("root"));
    QCOMPARE(QString::fromStdString(contmon::userNameForUid(std::nullopt)), QStringLiteral("unknown"));
}

void ProcInventoryTests::testCollectProcessesFiltersByThreadCount()
{
    contmon::ProcInventory inventory(m_procRoot, kTicks);
    QVERIFY(inventory.listPids() == (std::vector<int>{100, 200, 300, 400}));

    const std::vector<contmon::ProcessInfo> processes =
        inventory.collectProcesses("web01-01234567", 1760000000000, 0ms);
    QCOMPARE(processes.size(), size_t(3));
    QCOMPARE(processes[0].pid, 100);
    QCOMPARE(processes[1].pid, 300);
    QCOMPARE(processes[2].pid, 400);

    const contmon::ProcessInfo &pool = processes[0];
    QCOMPARE(QString::fromStdString(pool.serverId), QStringLiteral("web01-01234567"));
    QCOMPARE(QString::fromStdString(pool.name), QStringLiteral("pool worker"));
    QCOMPARE(QString::fromStdString(pool.userName), QStringLiteral("root"));
    QCOMPARE(QString::fromStdString(pool.status), QStringLiteral("Sleeping"));
    QCOMPARE(pool.timestamp, int64_t(1760000000000));
    QCOMPARE(pool.trend.size(), size_t(1));
    QCOMPARE(pool.trend[0].timestamp, int64_t(1760000000000));
    QCOMPARE(pool.trend[0].threadCount, int64_t(25));
    QCOMPARE(pool.trend[0].memoryUsage, 25.0);
    QCOMPARE(pool.trend[0].cpuUsage, 0.0);
    QCOMPARE(pool.threads.size(), size_t(2));

    const contmon::ProcessInfo &twin = processes[2];
    QCOMPARE(QString::fromStdString(twin.userName), QStringLiteral("unknown"));
    QCOMPARE(QString::fromStdString(twin.status), QStringLiteral("Waiting"));
    QCOMPARE(twin.trend[0].memoryUsage, 0.0);
    QVERIFY(twin.threads.empty());
}

void ProcInventoryTests::testThreadDetailsCappedAndOrdered()
{
    contmon::ProcInventory inventory(m_procRoot, kTicks);
    const std::vector<contmon::ThreadInfo> threads = inventory.threadDetails(300, "root");

    QCOMPARE(threads.size(), contmon::kMaxThreadDetails);
    QCOMPARE(threads.front().threadId, 300);
    QCOMPARE(threads.back().threadId, 309);

    const contmon::ThreadInfo &second = threads[1];
    QCOMPARE(QString::fromStdString(second.userName), QStringLiteral("root"));
    QCOMPARE(QString::fromStdString(second.command), QStringLiteral("busy-301"));
    QCOMPARE(QString::fromStdString(second.status), QStringLiteral("Running"));
    QCOMPARE(second.priority, int64_t(10));
    QCOMPARE(second.niceValue, int64_t(-10));
    QCOMPARE(QString::fromStdString(second.virtualMemory), QStringLiteral("2G"));
    QCOMPARE(QString::fromStdString(second.residentMemory), QStringLiteral("2M"));
    QCOMPARE(QString::fromStdString(second.sharedMemory), QStringLiteral("0K"));
    QCOMPARE(QString::fromStdString(second.cpuUsage), QStringLiteral("0.0"));
    QCOMPARE(QString::fromStdString(second.memoryUsage), QStringLiteral("0.0"));
    // Uptime 5000.5 s, started 100000 ticks (1000 s) after boot.
    QCOMPARE(QString::fromStdString(second.runtime), QStringLiteral("1:06:40"));

    QVERIFY(inventory.threadDetails(999, "root").empty());
}

void ProcInventoryTests::testMaxThreadsProcess()
{
    contmon::ProcInventory inventory(m_procRoot, kTicks);
    const auto busiest = inventory.maxThreadsProcess("srv", 42, 0ms);

    QVERIFY(busiest.has_value());
    QCOMPARE(busiest->pid, 300);
    QCOMPARE(QString::fromStdString(busiest->name), QStringLiteral("busy (main)"));
    QCOMPARE(busiest->trend[0].threadCount, int64_t(40));
    QCOMPARE(busiest->trend[0].memoryUsage, 10.0);
    QCOMPARE(busiest->threads.size(), contmon::kMaxThreadDetails);
}

void ProcInventoryTests::testMaxThreadsProcessEmptyTree()
{
    QTemporaryDir empty;
    QVERIFY(empty.isValid());
    contmon::ProcInventory inventory(empty.path(), kTicks);

    QVERIFY(!inventory.maxThreadsProcess("srv", 0, 0ms).has_value());
    QVERIFY(inventory.collectProcesses("srv", 0, 0ms).empty());
}

void ProcInventoryTests::testCollectMetrics()
{
    contmon::ProcInventory inventory(m_procRoot, kTicks);
    inventory.setVolumes({{1000, 250}, {1000, 750}});

    const contmon::MetricsSample metrics = inventory.collectMetrics("srv", 1234, 0ms, 0ms);
    QCOMPARE(QString::fromStdString(metrics.serverId), QStringLiteral("srv"));
    QCOMPARE(metrics.timestamp, int64_t(1234));
    QCOMPARE(metrics.cpuUsage, 0.0);
    QCOMPARE(metrics.memoryUsage, 75.0);
    QCOMPARE(metrics.diskUsage, 50.0);
    // 2048 and 4096 sectors of 512 bytes.
    QCOMPARE(metrics.ioRead, 1.0);
    QCOMPARE(metrics.ioWrite, 2.0);
    // Counters did not move between the two reads.
    QCOMPARE(metrics.networkIn, 0.0);
    QCOMPARE(metrics.networkOut, 0.0);

    QTemporaryDir empty;
    QVERIFY(empty.isValid());
    contmon::ProcInventory missing(empty.path(), kTicks);
    missing.setVolumes({});
    const contmon::MetricsSample none = missing.collectMetrics("srv", 1, 0ms, 0ms);
    QCOMPARE(none.cpuUsage, 0.0);
    QCOMPARE(none.memoryUsage, 0.0);
    QCOMPARE(none.ioRead, 0.0);
}

void ProcInventoryTests::testReportJsonKeys()
{
    contmon::ProcInventory inventory(m_procRoot, kTicks);
    const auto busiest = inventory.maxThreadsProcess("srv", 42, 0ms);
    QVERIFY(busiest.has_value());

    const nlohmann::json process = *busiest;
    for (const char *key : {"serverId", "pid", "name", "userName", "status", "timestamp",
                            "trend", "threads"}) {
        QVERIFY2(process.contains(key), key);
    }
    QCOMPARE(process["trend"][0]["threadCount"].get<int>(), 40);
    const nlohmann::json &thread = process["threads"][0];
    for (const char *key : {"threadId", "userName", "priority", "niceValue", "virtualMemory",
                            "residentMemory", "sharedMemory", "status", "cpuUsage",
                            "memoryUsage", "runtime", "command"}) {
        QVERIFY2(thread.contains(key), key);
    }

    contmon::MetricsSample sample;
    sample.serverId = "srv";
    sample.diskUsage = 12.5;
    const nlohmann::json report = nlohmann::json::array({sample});
    QCOMPARE(report.size(), size_t(1));
    QCOMPARE(report[0]["diskUsage"].get<double>(), 12.5);
    for (const char *key : {"serverId", "timestamp", "cpuUsage", "memoryUsage", "diskUsage",
                            "ioRead", "ioWrite", "networkIn", "networkOut"}) {
        QVERIFY2(report[0].contains(key), key);
    }
    QVERIFY(contmon::dumpReport(report).find("\"networkOut\"") != std::string::npos);
}

QTEST_MAIN(ProcInventoryTests)
#include "test_proc_inventory.moc"
