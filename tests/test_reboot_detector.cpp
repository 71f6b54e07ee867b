#include <QtTest/QtTest>

#include <QFile>
#include <QTemporaryDir>

#include "common/json_utils.hpp"
#include "daemon/kmsg_parser.hpp"
#include "daemon/reboot_detector.hpp"

class RebootDetectorTests : public QObject
{
    Q_OBJECT
private slots:
    void testBootIdChangeResetsOffset();
    void testSameBootIdKeepsCheckpoint();
    void testFirstRunAdoptsBootId();
    void testEmptyBootIdBecomesUnknown();
    void testUnknownStaysStableAcrossRestarts();
    void testResetMakesWholeBufferNew();
    void testReadBootIdTrimsNewline();
    void testReadBootIdMissingFile();
    void testReadBootIdEmptyFile();
};

void RebootDetectorTests::testBootIdChangeResetsOffset()
{
    const contmon::Checkpoint stored{"abc", *contmon::parseBootOffset("500.0")};

    const auto result = contmon::checkAndMaybeReset("xyz", stored);

    QVERIFY(result.resetOccurred);
    QCOMPARE(QString::fromStdString(result.checkpoint.bootId), QStringLiteral("xyz"));
    QCOMPARE(result.checkpoint.lastLogOffset, contmon::BootOffset{0});
}

void RebootDetectorTests::testSameBootIdKeepsCheckpoint()
{
    const contmon::Checkpoint stored{"abc", *contmon::parseBootOffset("500.25")};

    const auto result = contmon::checkAndMaybeReset("abc", stored);

    QVERIFY(!result.resetOccurred);
    QCOMPARE(QString::fromStdString(result.checkpoint.bootId), QStringLiteral("abc"));
    QCOMPARE(result.checkpoint.lastLogOffset, *contmon::parseBootOffset("500.25"));
}

void RebootDetectorTests::testFirstRunAdoptsBootId()
{
    const auto result = contmon::checkAndMaybeReset("abc", contmon::Checkpoint{});

    QVERIFY(result.resetOccurred);
    QCOMPARE(QString::fromStdString(result.checkpoint.bootId), QStringLiteral("abc"));
    QCOMPARE(result.checkpoint.lastLogOffset, contmon::BootOffset{0});
}

void RebootDetectorTests::testEmptyBootIdBecomesUnknown()
{
    const contmon::Checkpoint stored{"abc", *contmon::parseBootOffset("9.0")};

    const auto result = contmon::checkAndMaybeReset("", stored);

    QVERIFY(result.resetOccurred);
    QCOMPARE(QString::fromStdString(result.checkpoint.bootId), QStringLiteral("unknown"));
    QCOMPARE(result.checkpoint.lastLogOffset, contmon::BootOffset{0});
}

void RebootDetectorTests::testUnknownStaysStableAcrossRestarts()
{
    const contmon::Checkpoint stored{"unknown", *contmon::parseBootOffset("77.5")};

    const auto fromEmpty = contmon::checkAndMaybeReset("", stored);
    QVERIFY(!fromEmpty.resetOccurred);
    QCOMPARE(fromEmpty.checkpoint.lastLogOffset, *contmon::parseBootOffset("77.5"));

    const auto fromSentinel = contmon::checkAndMaybeReset("unknown", stored);
    QVERIFY(!fromSentinel.resetOccurred);
}

void RebootDetectorTests::testResetMakesWholeBufferNew()
{
    const contmon::Checkpoint stored{"abc", *contmon::parseBootOffset("500.0")};
    const auto reset = contmon::checkAndMaybeReset("xyz", stored);

    const auto batch = contmon::parseRingBufferOutput(
        "[    0.100000] a\n"
        "[    1.000000] b\n"
        "  continuation\n"
        "[    2.500000] c\n");
    const auto result = contmon::extractNewEntries(batch, reset.checkpoint.lastLogOffset);

    QCOMPARE(result.newEntries.size(), static_cast<size_t>(3));
    QCOMPARE(result.newOffset, *contmon::parseBootOffset("2.5"));
}

void RebootDetectorTests::testReadBootIdTrimsNewline()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.path() + "/boot_id";
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("6b2f0c1d-aaaa-bbbb-cccc-0123456789ab\n");
    file.close();

    QCOMPARE(QString::fromStdString(contmon::readBootId(path.toStdString())),
             QStringLiteral("6b2f0c1d-aaaa-bbbb-cccc-0123456789ab"));
}

void RebootDetectorTests::testReadBootIdMissingFile()
{
    QCOMPARE(QString::fromStdString(contmon::readBootId("/nonexistent/contmon/boot_id")),
             QStringLiteral("unknown"));
}

void RebootDetectorTests::testReadBootIdEmptyFile()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.path() + "/boot_id";
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("  \n");
    file.close();

    QCOMPARE(QString::fromStdString(contmon::readBootId(path.toStdString())),
             QStringLiteral("unknown"));
}

QTEST_MAIN(RebootDetectorTests)
#include "test_reboot_detector.moc"
