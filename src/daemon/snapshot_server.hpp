#pragma once

#include <QObject>
#include <QLocalServer>
#include <QLocalSocket>

#include <nlohmann/json.hpp>

#include "daemon/monitor_daemon.hpp"

namespace contmon {

/**
 * SnapshotServer exposes the monitor's latest snapshot and checkpoint over a
 * local UNIX socket using a minimal JSON-RPC-like protocol: one request object
 * per connection, one response, then the server disconnects.
 */
class SnapshotServer : public QObject
{
    Q_OBJECT
public:
    explicit SnapshotServer(const MonitorDaemon &daemon, QObject *parent = nullptr);
    ~SnapshotServer() override;

    // Listen on socketPath; a bare name goes into the platform runtime dir.
    bool start(const QString &socketPath);
    QString serverName() const;

    // Process a single request payload without a socket round-trip.
    QByteArray handleRequestPayload(const QByteArray &payload);

private slots:
    void handleNewConnection();
    void handleClientReadyRead();

private:
    QByteArray makeErrorResponse(const QString &message, int id = -1) const;
    QByteArray makeResultResponse(const nlohmann::json &result, int id) const;

    const MonitorDaemon &m_daemon;
    QLocalServer m_server;
};

} // namespace contmon
