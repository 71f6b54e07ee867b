#pragma once

#include <QString>
#include <QStringList>

namespace contmon {

struct CommandResult {
    bool started = false;
    int exitCode = -1;
    QString output;
};

// Runs an external tool synchronously and captures stdout. A tool that cannot
// be started, times out or crashes yields started == false or a non-zero
// exitCode with whatever output it produced.
CommandResult runCommand(const QString &program,
                         const QStringList &arguments,
                         int timeoutMs = 10000);

} // namespace contmon
