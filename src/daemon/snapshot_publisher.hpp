#pragma once

#include <QString>

#include "common/models.hpp"

namespace contmon {

// Writes each snapshot to a fixed file, replacing the previous one atomically.
class SnapshotPublisher {
public:
    explicit SnapshotPublisher(QString outputPath);

    // Returns false and fills errorMessage when the file cannot be written;
    // the previous document is left in place in that case.
    bool publish(const MonitorSnapshot &snapshot, QString *errorMessage = nullptr);

    QString outputPath() const;

private:
    QString m_outputPath;
};

} // namespace contmon
