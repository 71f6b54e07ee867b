#include "daemon/snapshot_publisher.hpp"

#include <utility>

#include <QDir>
#include <QFileInfo>
#include <QSaveFile>

#include "common/json_utils.hpp"

namespace contmon {

SnapshotPublisher::SnapshotPublisher(QString outputPath)
    : m_outputPath(std::move(outputPath))
{
}

QString SnapshotPublisher::outputPath() const
{
    return m_outputPath;
}

bool SnapshotPublisher::publish(const MonitorSnapshot &snapshot, QString *errorMessage)
{
    const QFileInfo info(m_outputPath);
    if (!QDir().mkpath(info.absolutePath())) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("cannot create directory %1")
                                .arg(info.absolutePath());
        }
        return false;
    }

    // QSaveFile writes to a temporary file and renames it over the target on commit.
    QSaveFile file(m_outputPath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        if (errorMessage) {
            *errorMessage = file.errorString();
        }
        return false;
    }

    const std::string document = dumpSnapshot(snapshot) + "\n";
    if (file.write(document.data(), static_cast<qint64>(document.size()))
        != static_cast<qint64>(document.size())) {
        if (errorMessage) {
            *errorMessage = file.errorString();
        }
        file.cancelWriting();
        return false;
    }

    if (!file.commit()) {
        if (errorMessage) {
            *errorMessage = file.errorString();
        }
        return false;
    }

    return true;
}

} // namespace contmon
