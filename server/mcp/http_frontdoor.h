#ifndef HTTP_FRONTDOOR_H
#define HTTP_FRONTDOOR_H

#include <QObject>
#include <QTcpServer>
#include <QTcpSocket>
#include <QHash>
#include <QByteArray>
#include <memory>
#include "http_request.h"
#include "session_transport.h"
#include "sse_channel.h"

namespace LangMcp {

/**
 * HTTP surface of the server:
 *   GET  /sse      opens the session channel (Server-Sent Events)
 *   POST /message  delivers one JSON-RPC message to the session transport
 *   GET  /health   liveness probe
 */
class HttpFrontDoor : public QObject
{
    Q_OBJECT

public:
    HttpFrontDoor(std::unique_ptr<QTcpServer> listener, SessionTransport* transport,
                  QObject* parent = nullptr);
    ~HttpFrontDoor();

    quint16 port() const;
    bool isListening() const;

    // Stop accepting, close the session channel and drop every connection
    void shutdown();

    static constexpr const char* SSE_PATH = "/sse";
    static constexpr const char* MESSAGE_PATH = "/message";
    static constexpr const char* HEALTH_PATH = "/health";

private slots:
    void handleNewConnection();
    void handleReadyRead();
    void handleDisconnected();

private:
    void route(QTcpSocket* socket, const HttpRequest& request);
    void handleSse(QTcpSocket* socket);
    void handlePostMessage(QTcpSocket* socket, const HttpRequest& request);
    void handleHealth(QTcpSocket* socket);
    void handlePreflight(QTcpSocket* socket);

    void respond(QTcpSocket* socket, int statusCode, const QByteArray& contentType, const QByteArray& body,
                 const QMap<QByteArray, QByteArray>& extraHeaders = {});
    void respondDispatchFailure(QTcpSocket* socket, const QJsonValue& id, const QString& cause);

    static QString peerName(QTcpSocket* socket);

    std::unique_ptr<QTcpServer> m_listener;
    SessionTransport* m_transport;

    QHash<QTcpSocket*, QByteArray> m_buffers;
    QHash<QTcpSocket*, std::shared_ptr<SseChannel>> m_sseChannels;
    bool m_shutdown;
};

} // namespace LangMcp

#endif // HTTP_FRONTDOOR_H
