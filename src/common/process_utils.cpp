#include "common/process_utils.hpp"

#include <QProcess>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace contmon {

CommandResult runCommand(const QString &program,
                         const QStringList &arguments,
                         int timeoutMs)
{
    CommandResult result;

    QProcess process;
    process.start(program, arguments);
    if (!process.waitForStarted(timeoutMs)) {
        CMLOG_DEBUG(QStringLiteral("process_utils"),
                    QStringLiteral("runCommand"),
                    QStringLiteral("command_not_started"),
                    process.errorString(),
                    QString(),
                    (nlohmann::json{{"program", program.toStdString()}}));
        return result;
    }
    result.started = true;

    process.closeWriteChannel();

    if (!process.waitForFinished(timeoutMs)) {
        process.kill();
        process.waitForFinished(1000);
        CMLOG_DEBUG(QStringLiteral("process_utils"),
                    QStringLiteral("runCommand"),
                    QStringLiteral("command_timeout"),
                    QStringLiteral("wait_for_finished"),
                    QString(),
                    (nlohmann::json{{"program", program.toStdString()},
                                    {"timeoutMs", timeoutMs}}));
        return result;
    }

    result.output = QString::fromUtf8(process.readAllStandardOutput());
    if (process.exitStatus() != QProcess::NormalExit) {
        return result;
    }

    result.exitCode = process.exitCode();
    return result;
}

} // namespace contmon
