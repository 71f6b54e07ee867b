#include "daemon/snapshot_server.hpp"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QUuid>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace contmon {

SnapshotServer::SnapshotServer(const MonitorDaemon &daemon, QObject *parent)
    : QObject(parent)
    , m_daemon(daemon)
{
}

SnapshotServer::~SnapshotServer() = default;

bool SnapshotServer::start(const QString &socketPath)
{
    if (socketPath.contains('/')) {
        const QFileInfo socketInfo(socketPath);
        if (!QDir().mkpath(socketInfo.absolutePath())) {
            qWarning() << "Failed to create runtime socket directory"
                       << socketInfo.absolutePath();
            return false;
        }

        if (QFile::exists(socketPath)) {
            if (!QLocalServer::removeServer(socketPath)) {
                qWarning() << "Failed to remove existing contmon socket" << socketPath;
                return false;
            }
        }
    } else {
        QLocalServer::removeServer(socketPath);
    }

    if (!m_server.listen(socketPath)) {
        qWarning() << "Failed to listen on contmon socket" << socketPath
                   << m_server.errorString();
        return false;
    }

    connect(&m_server, &QLocalServer::newConnection,
            this, &SnapshotServer::handleNewConnection);

    qInfo() << "contmon snapshot server listening on" << m_server.fullServerName();
    return true;
}

QString SnapshotServer::serverName() const
{
    return m_server.fullServerName();
}

void SnapshotServer::handleNewConnection()
{
    while (m_server.hasPendingConnections()) {
        QLocalSocket *socket = m_server.nextPendingConnection();
        if (!socket) {
            continue;
        }
        connect(socket, &QLocalSocket::readyRead,
                this, &SnapshotServer::handleClientReadyRead);
        connect(socket, &QLocalSocket::disconnected,
                socket, &QObject::deleteLater);
    }
}

void SnapshotServer::handleClientReadyRead()
{
    auto *socket = qobject_cast<QLocalSocket *>(sender());
    if (!socket) {
        return;
    }

    const QByteArray payload = socket->readAll();
    if (payload.isEmpty()) {
        return;
    }

    socket->write(handleRequestPayload(payload));
    socket->flush();
    socket->disconnectFromServer();
}

QByteArray SnapshotServer::handleRequestPayload(const QByteArray &payload)
{
    const QString corrId = QUuid::createUuid().toString(QUuid::WithoutBraces);
    logging::CorrelationScope corrScope(corrId);

    const auto parsed = nlohmann::json::parse(payload.toStdString(), nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        CMLOG_WARN(QStringLiteral("SnapshotServer"),
                   QStringLiteral("handleRequest"),
                   QStringLiteral("api_request_error"),
                   QStringLiteral("parse_payload"),
                   corrId,
                   nlohmann::json::object());
        return makeErrorResponse(QStringLiteral("Invalid JSON payload"));
    }

    int id = -1;
    if (parsed.contains("id") && parsed["id"].is_number_integer()) {
        id = parsed["id"].get<int>();
    }

    if (!parsed.contains("method") || !parsed["method"].is_string()) {
        CMLOG_WARN(QStringLiteral("SnapshotServer"),
                   QStringLiteral("handleRequest"),
                   QStringLiteral("api_request_error"),
                   QStringLiteral("missing_method"),
                   corrId,
                   nlohmann::json::object());
        return makeErrorResponse(QStringLiteral("Missing method"), id);
    }

    if (parsed.contains("params") && !parsed["params"].is_object()) {
        return makeErrorResponse(QStringLiteral("Invalid params"), id);
    }

    const std::string method = parsed["method"].get<std::string>();
    CMLOG_DEBUG(QStringLiteral("SnapshotServer"),
                QStringLiteral("handleRequest"),
                QStringLiteral("api_request_received"),
                QStringLiteral("client_call"),
                corrId,
                (nlohmann::json{{"method", method}}));

    if (method == "get_latest_snapshot" || method == "get_all_data") {
        const auto snapshot = m_daemon.latestSnapshot();
        if (!snapshot.has_value()) {
            return makeResultResponse(nlohmann::json::object(), id);
        }
        return makeResultResponse(nlohmann::json(*snapshot), id);
    }

    if (method == "get_checkpoint") {
        return makeResultResponse(nlohmann::json(m_daemon.currentCheckpoint()), id);
    }

    if (method == "ping") {
        return makeResultResponse(nlohmann::json{{"status", "ok"},
                                                 {"cycles", m_daemon.cycleCount()}},
                                  id);
    }

    CMLOG_WARN(QStringLiteral("SnapshotServer"),
               QStringLiteral("handleRequest"),
               QStringLiteral("api_request_error"),
               QStringLiteral("unknown_method"),
               corrId,
               (nlohmann::json{{"method", method}}));
    return makeErrorResponse(QStringLiteral("Unknown method"), id);
}

QByteArray SnapshotServer::makeErrorResponse(const QString &message, int id) const
{
    nlohmann::json response;
    response["error"] = message.toStdString();
    response["id"] = id;
    return QByteArray::fromStdString(response.dump());
}

QByteArray SnapshotServer::makeResultResponse(const nlohmann::json &result, int id) const
{
    nlohmann::json response;
    response["result"] = result;
    response["id"] = id;
    return QByteArray::fromStdString(
        response.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

} // namespace contmon
