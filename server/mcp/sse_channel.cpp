#include "sse_channel.h"
#include "shared/langmcplogger.h"
#include <QJsonDocument>
#include <QUuid>

namespace LangMcp {

SseChannel::SseChannel(QTcpSocket* socket)
    : m_socket(socket)
    , m_sessionId(QUuid::createUuid().toString(QUuid::WithoutBraces))
    , m_closed(false)
{
}

SseChannel::~SseChannel()
{
    close();
}

bool SseChannel::open(const QString& messagePath)
{
    if (!isOpen()) {
        return false;
    }

    QByteArray headers =
        "HTTP/1.1 200 OK\r\n"
        "Content-Type: text/event-stream\r\n"
        "Cache-Control: no-cache\r\n"
        "Connection: keep-alive\r\n"
        "Access-Control-Allow-Origin: *\r\n"
        "\r\n";

    if (m_socket->write(headers) == -1) {
        return false;
    }

    QString endpoint = QString("%1?sessionId=%2").arg(messagePath, m_sessionId);
    return writeEvent("endpoint", endpoint.toUtf8());
}

bool SseChannel::isOpen() const
{
    return !m_closed && m_socket && m_socket->state() == QAbstractSocket::ConnectedState;
}

bool SseChannel::send(const QJsonObject& message)
{
    if (!isOpen()) {
        return false;
    }
    return writeEvent("message", QJsonDocument(message).toJson(QJsonDocument::Compact));
}

bool SseChannel::writeEvent(const QByteArray& event, const QByteArray& data)
{
    QByteArray frame;
    frame.reserve(event.size() + data.size() + 16);
    frame.append("event: ").append(event).append('\n');
    frame.append("data: ").append(data).append("\n\n");

    qint64 written = m_socket->write(frame);
    if (written != frame.size()) {
        LangMcpLogger::instance().log(LogLevel::Warning, "server",
            QString("SSE write to session %1 failed: %2").arg(m_sessionId, m_socket->errorString()));
        return false;
    }
    m_socket->flush();
    return true;
}

void SseChannel::close()
{
    if (m_closed) {
        return;
    }
    m_closed = true;

    if (m_socket && m_socket->state() != QAbstractSocket::UnconnectedState) {
        m_socket->disconnectFromHost();
    }
}

} // namespace LangMcp
