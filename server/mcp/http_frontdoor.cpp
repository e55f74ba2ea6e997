#include "http_frontdoor.h"
#include "mcpserver_sse.h"
#include "shared/langmcplogger.h"
#include <QJsonDocument>
#include <QJsonObject>

namespace LangMcp {

HttpFrontDoor::HttpFrontDoor(std::unique_ptr<QTcpServer> listener, SessionTransport* transport,
                             QObject* parent)
    : QObject(parent)
    , m_listener(std::move(listener))
    , m_transport(transport)
    , m_shutdown(false)
{
    connect(m_listener.get(), &QTcpServer::newConnection, this, &HttpFrontDoor::handleNewConnection);
}

HttpFrontDoor::~HttpFrontDoor()
{
    shutdown();
}

quint16 HttpFrontDoor::port() const
{
    return m_listener ? m_listener->serverPort() : 0;
}

bool HttpFrontDoor::isListening() const
{
    return m_listener && m_listener->isListening();
}

void HttpFrontDoor::shutdown()
{
    if (m_shutdown) {
        return;
    }
    m_shutdown = true;

    if (m_listener) {
        disconnect(m_listener.get(), nullptr, this, nullptr);
        m_listener->close();
    }

    // The transport forgets the channel first so socket teardown below finds nothing live
    m_transport->closeChannel();

    QList<QTcpSocket*> sockets = m_buffers.keys();
    for (QTcpSocket* socket : m_sseChannels.keys()) {
        if (!sockets.contains(socket)) {
            sockets.append(socket);
        }
    }
    m_buffers.clear();
    m_sseChannels.clear();

    for (QTcpSocket* socket : sockets) {
        disconnect(socket, nullptr, this, nullptr);
        socket->abort();
        socket->deleteLater();
    }

    LangMcpLogger::instance().log(LogLevel::Info, "server", "HTTP front door shut down");
}

void HttpFrontDoor::handleNewConnection()
{
    while (m_listener->hasPendingConnections()) {
        QTcpSocket* socket = m_listener->nextPendingConnection();
        m_buffers.insert(socket, QByteArray());
        connect(socket, &QTcpSocket::readyRead, this, &HttpFrontDoor::handleReadyRead);
        connect(socket, &QTcpSocket::disconnected, this, &HttpFrontDoor::handleDisconnected);
    }
}

void HttpFrontDoor::handleReadyRead()
{
    QTcpSocket* socket = qobject_cast<QTcpSocket*>(sender());
    if (!socket) {
        return;
    }

    // Nothing is expected from the client once the stream is open
    if (m_sseChannels.contains(socket)) {
        socket->readAll();
        return;
    }

    if (!m_buffers.contains(socket)) {
        return;
    }

    QByteArray& buffer = m_buffers[socket];
    buffer.append(socket->readAll());

    HttpRequest request;
    switch (parseHttpRequest(buffer, request)) {
        case ParseStatus::Incomplete:
            return;
        case ParseStatus::Malformed:
            LangMcpLogger::instance().log(LogLevel::Warning, "server",
                QString("Malformed HTTP request from %1").arg(peerName(socket)));
            respond(socket, 400, "text/plain", "Bad Request");
            return;
        case ParseStatus::TooLarge:
            LangMcpLogger::instance().log(LogLevel::Warning, "server",
                QString("HTTP request too large from %1").arg(peerName(socket)));
            respond(socket, 413, "text/plain", "Request body too large");
            return;
        case ParseStatus::Complete:
            break;
    }

    route(socket, request);
}

void HttpFrontDoor::handleDisconnected()
{
    QTcpSocket* socket = qobject_cast<QTcpSocket*>(sender());
    if (!socket) {
        return;
    }

    m_buffers.remove(socket);
    std::shared_ptr<SseChannel> channel = m_sseChannels.take(socket);
    if (channel) {
        LangMcpLogger::instance().log(LogLevel::Info, "server",
            QString("SSE client %1 disconnected").arg(peerName(socket)));
        m_transport->closeChannel(channel);
    }

    socket->deleteLater();
}

void HttpFrontDoor::route(QTcpSocket* socket, const HttpRequest& request)
{
    LangMcpLogger::instance().log(LogLevel::Debug, "server",
        QString("%1 %2 from %3").arg(request.method, request.path, peerName(socket)));

    if (request.method == "OPTIONS") {
        handlePreflight(socket);
    } else if (request.method == "GET" && request.path == SSE_PATH) {
        handleSse(socket);
    } else if (request.method == "POST" && request.path == MESSAGE_PATH) {
        handlePostMessage(socket, request);
    } else if (request.method == "GET" && request.path == HEALTH_PATH) {
        handleHealth(socket);
    } else {
        respond(socket, 404, "text/plain", "Not Found");
    }
}

void HttpFrontDoor::handleSse(QTcpSocket* socket)
{
    m_transport->beginEstablishing();

    auto channel = std::make_shared<SseChannel>(socket);
    m_buffers.remove(socket);
    m_sseChannels.insert(socket, channel);

    if (!channel->open(MESSAGE_PATH)) {
        LangMcpLogger::instance().log(LogLevel::Warning, "server",
            QString("Could not open SSE stream for %1").arg(peerName(socket)));
        m_sseChannels.remove(socket);
        m_transport->abortEstablishing();
        socket->abort();
        return;
    }

    LangMcpLogger::instance().log(LogLevel::Info, "server",
        QString("SSE client %1 connected, session %2").arg(peerName(socket), channel->sessionId()));

    m_transport->openChannel(channel);
}

void HttpFrontDoor::handlePostMessage(QTcpSocket* socket, const HttpRequest& request)
{
    QString sessionId = request.query.queryItemValue("sessionId");
    std::shared_ptr<SessionChannel> current = m_transport->currentChannel();
    if (current && !sessionId.isEmpty() && sessionId != current->sessionId()) {
        respond(socket, 404, "text/plain", "Session not found");
        return;
    }

    QJsonParseError error;
    QJsonDocument doc = QJsonDocument::fromJson(request.body, &error);
    if (error.error != QJsonParseError::NoError) {
        respondDispatchFailure(socket, QJsonValue::Null, QString("Parse error: %1").arg(error.errorString()));
        return;
    }
    if (!doc.isObject()) {
        respondDispatchFailure(socket, QJsonValue::Null, "Invalid JSON-RPC message: expected an object");
        return;
    }

    QJsonObject message = doc.object();
    DeliveryResult result = m_transport->deliver(message, peerName(socket));

    switch (result.status) {
        case DeliveryStatus::Delivered:
            respond(socket, 202, "text/plain", "Accepted");
            break;
        case DeliveryStatus::Queued: {
            QJsonObject body{{"status", "queued"}, {"pending", result.pending}};
            respond(socket, 202, "application/json", QJsonDocument(body).toJson(QJsonDocument::Compact));
            break;
        }
        case DeliveryStatus::Failed:
            LangMcpLogger::instance().log(LogLevel::Warning, "server",
                QString("Dispatch failed for message from %1: %2").arg(peerName(socket), result.error));
            respondDispatchFailure(socket, message.value("id"), result.error);
            break;
    }
}

void HttpFrontDoor::handleHealth(QTcpSocket* socket)
{
    QJsonObject body{{"status", "ok"}};
    respond(socket, 200, "application/json", QJsonDocument(body).toJson(QJsonDocument::Compact));
}

void HttpFrontDoor::handlePreflight(QTcpSocket* socket)
{
    respond(socket, 204, QByteArray(), QByteArray(), {
        {"Access-Control-Allow-Methods", "GET, POST, OPTIONS"},
        {"Access-Control-Allow-Headers", "Content-Type, Accept, Authorization"},
        {"Access-Control-Max-Age", "86400"}
    });
}

void HttpFrontDoor::respondDispatchFailure(QTcpSocket* socket, const QJsonValue& id, const QString& cause)
{
    QJsonValue responseId = id.isUndefined() ? QJsonValue(QJsonValue::Null) : id;
    QJsonObject body = MCPServerSse::makeError(responseId, MCPServerSse::SERVER_ERROR, cause);
    respond(socket, 500, "application/json", QJsonDocument(body).toJson(QJsonDocument::Compact));
}

void HttpFrontDoor::respond(QTcpSocket* socket, int statusCode, const QByteArray& contentType,
                            const QByteArray& body, const QMap<QByteArray, QByteArray>& extraHeaders)
{
    m_buffers.remove(socket);
    socket->write(buildHttpResponse(statusCode, contentType, body, extraHeaders));
    socket->disconnectFromHost();
}

QString HttpFrontDoor::peerName(QTcpSocket* socket)
{
    return QString("%1:%2").arg(socket->peerAddress().toString()).arg(socket->peerPort());
}

} // namespace LangMcp
