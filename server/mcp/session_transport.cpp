#include "session_transport.h"
#include "shared/langmcplogger.h"
#include <exception>

namespace LangMcp {

const char* channelStateToString(ChannelState state)
{
    switch (state) {
        case ChannelState::Absent:       return "absent";
        case ChannelState::Establishing: return "establishing";
        case ChannelState::Live:         return "live";
        case ChannelState::Closed:       return "closed";
    }
    return "unknown";
}

SessionTransport::SessionTransport(MessageHandler handler)
    : m_handler(std::move(handler))
    , m_state(ChannelState::Absent)
    , m_draining(false)
    , m_generation(0)
    , m_nextSequence(0)
{
}

SessionTransport::~SessionTransport()
{
    closeChannel();

    QMutexLocker locker(&m_mutex);
    if (!m_pending.isEmpty()) {
        LangMcpLogger::instance().log(LogLevel::Warning, "server",
            QString("Discarding %1 queued message(s) that never reached a channel").arg(m_pending.size()));
    }
}

void SessionTransport::beginEstablishing()
{
    QMutexLocker locker(&m_mutex);
    if (m_state == ChannelState::Absent || m_state == ChannelState::Closed) {
        m_state = ChannelState::Establishing;
    }
}

void SessionTransport::abortEstablishing()
{
    QMutexLocker locker(&m_mutex);
    if (m_state == ChannelState::Establishing && !m_channel) {
        m_state = ChannelState::Absent;
    }
}

void SessionTransport::openChannel(std::shared_ptr<SessionChannel> channel)
{
    if (!channel) {
        return;
    }

    std::shared_ptr<SessionChannel> superseded;
    quint64 generation = 0;
    int queued = 0;
    {
        QMutexLocker locker(&m_mutex);
        superseded = m_channel;
        m_channel = channel;
        m_state = ChannelState::Live;
        m_draining = true;
        generation = ++m_generation;
        queued = m_pending.size();
    }

    if (superseded && superseded != channel) {
        LangMcpLogger::instance().log(LogLevel::Info, "server",
            QString("Session %1 superseded by %2").arg(superseded->sessionId(), channel->sessionId()));
        superseded->close();
    }

    LangMcpLogger::instance().log(LogLevel::Info, "server",
        QString("Session %1 live, %2 queued message(s) to replay").arg(channel->sessionId()).arg(queued));

    drain(channel, generation);
}

void SessionTransport::drain(const std::shared_ptr<SessionChannel>& channel, quint64 generation)
{
    for (;;) {
        PendingMessage next;
        {
            QMutexLocker locker(&m_mutex);
            if (m_generation != generation || m_state != ChannelState::Live) {
                // Superseded or closed mid-drain; the rest waits for the next channel
                return;
            }
            if (m_pending.isEmpty()) {
                m_draining = false;
                return;
            }
            next = m_pending.takeFirst();
        }

        DispatchOutcome outcome = dispatch(next.payload, channel);
        if (!outcome.ok) {
            LangMcpLogger::instance().log(LogLevel::Warning, "server",
                QString("Replay of queued message #%1 from %2 failed: %3")
                .arg(next.sequence).arg(next.origin.isEmpty() ? "unknown" : next.origin, outcome.error));
        }
    }
}

DeliveryResult SessionTransport::deliver(const QJsonObject& message, const QString& origin)
{
    std::shared_ptr<SessionChannel> channel;
    {
        QMutexLocker locker(&m_mutex);
        // While a drain is running new messages go behind the queued ones
        if (m_state != ChannelState::Live || m_draining) {
            m_pending.append({message, origin, ++m_nextSequence});
            return {DeliveryStatus::Queued, static_cast<int>(m_pending.size()), QString()};
        }
        channel = m_channel;
    }

    DispatchOutcome outcome = dispatch(message, channel);
    if (!outcome.ok) {
        return {DeliveryStatus::Failed, 0, outcome.error};
    }
    return {DeliveryStatus::Delivered, 0, QString()};
}

DispatchOutcome SessionTransport::dispatch(const QJsonObject& message,
                                           const std::shared_ptr<SessionChannel>& channel)
{
    if (!m_handler) {
        return DispatchOutcome::failure("No message handler attached");
    }
    try {
        return m_handler(message, channel);
    } catch (const std::exception& e) {
        return DispatchOutcome::failure(QString::fromUtf8(e.what()));
    }
}

void SessionTransport::closeChannel(const std::shared_ptr<SessionChannel>& channel)
{
    std::shared_ptr<SessionChannel> closing;
    quint64 generation = 0;
    {
        QMutexLocker locker(&m_mutex);
        if (!m_channel) {
            return;
        }
        if (channel && channel != m_channel) {
            LangMcpLogger::instance().log(LogLevel::Debug, "server",
                QString("Ignoring close of stale session %1 while %2")
                .arg(channel->sessionId(), QString::fromLatin1(channelStateToString(m_state))));
            return;
        }
        closing = std::move(m_channel);
        m_channel = nullptr;
        m_state = ChannelState::Closed;
        m_draining = false;
        generation = ++m_generation;
    }

    LangMcpLogger::instance().log(LogLevel::Info, "server",
        QString("Session %1 closed").arg(closing->sessionId()));
    closing->close();

    QMutexLocker locker(&m_mutex);
    if (m_generation == generation && m_state == ChannelState::Closed) {
        m_state = ChannelState::Absent;
    }
}

ChannelState SessionTransport::state() const
{
    QMutexLocker locker(&m_mutex);
    return m_state;
}

int SessionTransport::pendingCount() const
{
    QMutexLocker locker(&m_mutex);
    return static_cast<int>(m_pending.size());
}

std::shared_ptr<SessionChannel> SessionTransport::currentChannel() const
{
    QMutexLocker locker(&m_mutex);
    return m_channel;
}

} // namespace LangMcp
