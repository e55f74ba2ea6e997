#ifndef SSE_CHANNEL_H
#define SSE_CHANNEL_H

#include <QPointer>
#include <QTcpSocket>
#include "session_channel.h"

namespace LangMcp {

// Server-Sent Events stream over an accepted HTTP connection
class SseChannel : public SessionChannel
{
public:
    explicit SseChannel(QTcpSocket* socket);
    ~SseChannel() override;

    // Write the event-stream response headers followed by the endpoint event
    // telling the client where to POST its messages.
    bool open(const QString& messagePath);

    QString sessionId() const override { return m_sessionId; }
    bool isOpen() const override;
    bool send(const QJsonObject& message) override;
    void close() override;


private:
    bool writeEvent(const QByteArray& event, const QByteArray& data);

    QPointer<QTcpSocket> m_socket;
    QString m_sessionId;
    bool m_closed;
};

} // namespace LangMcp

#endif // SSE_CHANNEL_H
