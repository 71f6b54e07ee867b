#include "common/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QThread>

#include <unistd.h>

#include <atomic>
#include <cstdio>
#include <mutex>

namespace contmon::logging {

namespace {

constexpr qint64 kMaxLogSizeBytes = 5 * 1024 * 1024;
// <name>.log.1 is the newest rotated file, <name>.log.3 the oldest kept.
constexpr int kRotatedGenerations = 3;

const char *levelName(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

// Process-wide destination for events. Files are opened per event so that an
// external rotation or deletion never leaves a stale handle behind.
class LogSink {
public:
    void configure(const QString &processName, bool traceEnabled)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_processName = processName;
        m_traceEnabled = traceEnabled;
    }

    bool traceEnabled() const
    {
        return m_traceEnabled.load();
    }

    QString processName() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_processName;
    }

    void write(const QString &process, const QByteArray &line)
    {
        const QString dir = logsDirPath();
        const QString base = dir + QDir::separator() + process;

        std::lock_guard<std::mutex> lock(m_mutex);
        QDir().mkpath(dir);
        append(base + QStringLiteral(".log"), line);
        if (m_traceEnabled.load()) {
            append(base + QStringLiteral("-trace.log"), line);
        }
    }

private:
    static void rotate(const QString &path)
    {
        const QFileInfo info(path);
        if (!info.exists() || info.size() < kMaxLogSizeBytes) {
            return;
        }

        QFile::remove(path + QStringLiteral(".%1").arg(kRotatedGenerations));
        for (int generation = kRotatedGenerations - 1; generation >= 1; --generation) {
            QFile::rename(path + QStringLiteral(".%1").arg(generation),
                          path + QStringLiteral(".%1").arg(generation + 1));
        }
        QFile::rename(path, path + QStringLiteral(".1"));
    }

    static void append(const QString &path, const QByteArray &line)
    {
        rotate(path);

        QFile file(path);
        if (!file.open(QIODevice::WriteOnly | QIODevice::Append)) {
            std::fprintf(stderr, "%s\n", line.constData());
            return;
        }
        file.write(line + '\n');
    }

    mutable std::mutex m_mutex;
    QString m_processName;
    std::atomic<bool> m_traceEnabled{false};
};

LogSink &sink()
{
    static LogSink instance;
    return instance;
}

std::atomic<quint64> g_sequence{0};

thread_local QString t_corrId;

} // namespace

void initLogging(const QString &processName, bool traceEnabled)
{
    sink().configure(processName, traceEnabled);
}

bool isTraceEnabled()
{
    return sink().traceEnabled();
}

QString logsDirPath()
{
    const QString overrideDir = qEnvironmentVariable("CONTMON_LOG_DIR");
    if (!overrideDir.isEmpty()) {
        return overrideDir;
    }
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return QStringLiteral(".local/share/contmon/logs");
    }
    return home + QStringLiteral("/.local/share/contmon/logs");
}

void setCorrelationId(const QString &corrId)
{
    t_corrId = corrId;
}

QString currentCorrelationId()
{
    return t_corrId;
}

CorrelationScope::CorrelationScope(const QString &corrId)
    : m_prev(t_corrId)
{
    t_corrId = corrId;
}

CorrelationScope::~CorrelationScope()
{
    t_corrId = m_prev;
}

QString defaultProcessName()
{
    const QString name = sink().processName();
    return name.isEmpty() ? QStringLiteral("contmon") : name;
}

QString defaultWho()
{
    static const QString who = [] {
        char hostname[256] = {};
        if (gethostname(hostname, sizeof(hostname) - 1) != 0) {
            hostname[0] = '\0';
        }
        return QStringLiteral("host:%1,uid:%2")
            .arg(QString::fromUtf8(hostname))
            .arg(static_cast<qulonglong>(getuid()));
    }();
    return who;
}

void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context)
{
    if (level == LogLevel::Debug && !sink().traceEnabled()) {
        return;
    }

    const nlohmann::json payload = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"seq", ++g_sequence},
        {"level", levelName(level)},
        {"process", processName.toStdString()},
        {"thread", QStringLiteral("0x%1")
                       .arg(reinterpret_cast<quintptr>(QThread::currentThreadId()), 0, 16)
                       .toStdString()},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"who", who.toStdString()},
        {"corr", (correlationId.isEmpty() ? t_corrId : correlationId).toStdString()},
        {"context", context}
    };

    const std::string line =
        payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    sink().write(processName.isEmpty() ? defaultProcessName() : processName,
                 QByteArray::fromStdString(line));
}

} // namespace contmon::logging
