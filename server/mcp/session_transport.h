#ifndef SESSION_TRANSPORT_H
#define SESSION_TRANSPORT_H

#include <QString>
#include <QJsonObject>
#include <QList>
#include <QMutex>
#include <functional>
#include <memory>
#include "session_channel.h"

namespace LangMcp {

enum class ChannelState {
    Absent,         // No client connected
    Establishing,   // Handshake in progress
    Live,           // Bound, messages flow
    Closed          // Released, about to return to Absent
};

const char* channelStateToString(ChannelState state);

enum class DeliveryStatus {
    Delivered,
    Queued,
    Failed
};

// What the message handler reports for one inbound message
struct DispatchOutcome {
    bool ok = true;
    QString error;

    static DispatchOutcome success() { return {true, QString()}; }
    static DispatchOutcome failure(const QString& error) { return {false, error}; }
};

struct DeliveryResult {
    DeliveryStatus status = DeliveryStatus::Delivered;
    int pending = 0;        // Queue length after a Queued delivery
    QString error;          // Set when status is Failed
};

struct PendingMessage {
    QJsonObject payload;
    QString origin;
    quint64 sequence = 0;
};

/**
 * Owns the single session channel and the queue of messages posted
 * before a channel existed.
 *
 * Messages posted while no channel is live are queued and replayed in
 * arrival order as soon as a channel goes live. A new channel supersedes
 * the previous one, which is closed. All state changes happen under one
 * mutex; the handler and channel close() always run outside it.
 */
class SessionTransport
{
public:
    using MessageHandler = std::function<DispatchOutcome(const QJsonObject& message,
                                                         const std::shared_ptr<SessionChannel>& channel)>;

    explicit SessionTransport(MessageHandler handler);
    ~SessionTransport();

    // Mark a handshake as started. Never blocks on prior state.
    void beginEstablishing();

    // Undo beginEstablishing when the handshake fails before a channel exists
    void abortEstablishing();

    // Bind the channel, then drain the pending queue into it
    void openChannel(std::shared_ptr<SessionChannel> channel);

    // Deliver now if a channel is live, otherwise queue
    DeliveryResult deliver(const QJsonObject& message, const QString& origin = QString());

    // Release the live channel. A channel other than the live one is
    // ignored; nullptr closes whatever is live. Idempotent.
    void closeChannel(const std::shared_ptr<SessionChannel>& channel = nullptr);

    ChannelState state() const;
    int pendingCount() const;
    std::shared_ptr<SessionChannel> currentChannel() const;

private:
    void drain(const std::shared_ptr<SessionChannel>& channel, quint64 generation);
    DispatchOutcome dispatch(const QJsonObject& message, const std::shared_ptr<SessionChannel>& channel);

    MessageHandler m_handler;

    mutable QMutex m_mutex;
    ChannelState m_state;
    std::shared_ptr<SessionChannel> m_channel;
    QList<PendingMessage> m_pending;
    bool m_draining;
    quint64 m_generation;
    quint64 m_nextSequence;
};

} // namespace LangMcp

#endif // SESSION_TRANSPORT_H
