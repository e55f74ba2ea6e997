#ifndef SERVER_LIFECYCLE_H
#define SERVER_LIFECYCLE_H

#include <QString>
#include <QHostAddress>
#include <QMutex>
#include <memory>
#include "reference_provider.h"
#include "tool_registry.h"

namespace LangMcp {

class MCPServerSse;
class SessionTransport;
class HttpFrontDoor;

enum class LifecycleError {
    None,
    AlreadyRunning,
    NotRunning,
    BindFailed
};

const char* lifecycleErrorToString(LifecycleError error);

struct StartResult {
    LifecycleError error = LifecycleError::None;
    quint16 port = 0;
    bool usedFallbackPort = false;
    QString message;

    bool ok() const { return error == LifecycleError::None; }
};

// Everything one running server owns; destroyed as a unit by stop()
struct ServerInstance {
    std::unique_ptr<MCPServerSse> protocolServer;
    std::unique_ptr<SessionTransport> transport;
    std::unique_ptr<HttpFrontDoor> frontDoor;
    quint16 port = 0;

    ServerInstance();
    ~ServerInstance();
};

/**
 * Starts and stops the server. At most one instance exists; a second
 * start() is rejected and stop() without a running instance is a no-op.
 */
class ServerLifecycle
{
public:
    explicit ServerLifecycle(std::shared_ptr<ReferenceProvider> provider,
                             const ToolRegistry& registry = ToolRegistry::createDefault());
    ~ServerLifecycle();

    StartResult start(quint16 preferredPort, const QHostAddress& address = QHostAddress::LocalHost);
    LifecycleError stop();

    bool isRunning() const;
    quint16 port() const;

    // Valid only while running; for diagnostics and tests
    SessionTransport* transport() const;

private:
    std::shared_ptr<ReferenceProvider> m_provider;
    ToolRegistry m_registry;

    mutable QMutex m_mutex;
    std::unique_ptr<ServerInstance> m_instance;
};

} // namespace LangMcp

#endif // SERVER_LIFECYCLE_H
