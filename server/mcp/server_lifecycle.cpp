#include "server_lifecycle.h"
#include "mcpserver_sse.h"
#include "session_transport.h"
#include "http_frontdoor.h"
#include "shared/common.h"
#include "shared/langmcplogger.h"

namespace LangMcp {

const char* lifecycleErrorToString(LifecycleError error)
{
    switch (error) {
        case LifecycleError::None:           return "None";
        case LifecycleError::AlreadyRunning: return "AlreadyRunning";
        case LifecycleError::NotRunning:     return "NotRunning";
        case LifecycleError::BindFailed:     return "BindFailed";
    }
    return "Unknown";
}

ServerInstance::ServerInstance() = default;

// Front door goes first: its shutdown still talks to the transport
ServerInstance::~ServerInstance()
{
    frontDoor.reset();
    transport.reset();
    protocolServer.reset();
}

ServerLifecycle::ServerLifecycle(std::shared_ptr<ReferenceProvider> provider, const ToolRegistry& registry)
    : m_provider(std::move(provider))
    , m_registry(registry)
{
}

ServerLifecycle::~ServerLifecycle()
{
    stop();
}

StartResult ServerLifecycle::start(quint16 preferredPort, const QHostAddress& address)
{
    QMutexLocker locker(&m_mutex);

    StartResult result;
    if (m_instance) {
        result.error = LifecycleError::AlreadyRunning;
        result.port = m_instance->port;
        result.message = QString("Server already running on port %1").arg(m_instance->port);
        LangMcpLogger::instance().warning(result.message);
        return result;
    }

    quint16 boundPort = 0;
    bool usedFallback = false;
    QString bindError;
    std::unique_ptr<QTcpServer> listener =
        LangMcpCommon::bindListener(preferredPort, boundPort, usedFallback, address, &bindError);
    if (!listener) {
        result.error = LifecycleError::BindFailed;
        result.message = QString("Could not bind a listener on %1 (preferred port %2): %3")
            .arg(address.toString()).arg(preferredPort).arg(bindError);
        LangMcpLogger::instance().error(result.message);
        return result;
    }

    auto instance = std::make_unique<ServerInstance>();
    instance->protocolServer = std::make_unique<MCPServerSse>(m_registry, m_provider);

    MCPServerSse* protocolServer = instance->protocolServer.get();
    instance->transport = std::make_unique<SessionTransport>(
        [protocolServer](const QJsonObject& message, const std::shared_ptr<SessionChannel>& channel) {
            return protocolServer->handleMessage(message, channel);
        });
    instance->frontDoor = std::make_unique<HttpFrontDoor>(std::move(listener), instance->transport.get());
    instance->port = boundPort;

    m_instance = std::move(instance);

    result.port = boundPort;
    result.usedFallbackPort = usedFallback;
    result.message = usedFallback
        ? QString("Listening on port %1 (preferred port %2 unavailable)").arg(boundPort).arg(preferredPort)
        : QString("Listening on port %1").arg(boundPort);
    LangMcpLogger::instance().info(result.message);
    return result;
}

LifecycleError ServerLifecycle::stop()
{
    QMutexLocker locker(&m_mutex);
    if (!m_instance) {
        return LifecycleError::NotRunning;
    }

    // Torn down under the lock so a concurrent start() never sees two listeners
    quint16 port = m_instance->port;
    m_instance.reset();

    LangMcpLogger::instance().info(QString("Server on port %1 stopped").arg(port));
    return LifecycleError::None;
}

bool ServerLifecycle::isRunning() const
{
    QMutexLocker locker(&m_mutex);
    return m_instance != nullptr;
}

quint16 ServerLifecycle::port() const
{
    QMutexLocker locker(&m_mutex);
    return m_instance ? m_instance->port : 0;
}

SessionTransport* ServerLifecycle::transport() const
{
    QMutexLocker locker(&m_mutex);
    return m_instance ? m_instance->transport.get() : nullptr;
}

} // namespace LangMcp
