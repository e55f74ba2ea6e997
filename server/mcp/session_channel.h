#ifndef SESSION_CHANNEL_H
#define SESSION_CHANNEL_H

#include <QString>
#include <QJsonObject>

namespace LangMcp {

/**
 * The single outbound stream a client is connected on. Responses to
 * posted requests are pushed through it.
 */
class SessionChannel
{
public:
    virtual ~SessionChannel() = default;

    virtual QString sessionId() const = 0;
    virtual bool isOpen() const = 0;

    // Returns false if the message could not be written
    virtual bool send(const QJsonObject& message) = 0;

    // Releases the underlying connection. Safe to call more than once.
    virtual void close() = 0;
};

} // namespace LangMcp

#endif // SESSION_CHANNEL_H
