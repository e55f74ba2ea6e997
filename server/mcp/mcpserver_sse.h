#ifndef MCPSERVER_SSE_H
#define MCPSERVER_SSE_H

#include <QJsonObject>
#include <QJsonValue>
#include <QString>
#include <memory>
#include "tool_dispatcher.h"
#include "session_transport.h"

namespace LangMcp {

/**
 * JSON-RPC side of the MCP server. Handles one inbound message at a time
 * and writes every response to the session channel it arrived for.
 */
class MCPServerSse
{
public:
    MCPServerSse(const ToolRegistry& registry, std::shared_ptr<ReferenceProvider> provider);

    // Suitable as a SessionTransport::MessageHandler
    DispatchOutcome handleMessage(const QJsonObject& message, const std::shared_ptr<SessionChannel>& channel);

    const ToolDispatcher& dispatcher() const { return m_dispatcher; }
    bool isInitialized() const { return m_initialized; }

    static QJsonObject makeResponse(const QJsonValue& id, const QJsonObject& result);
    static QJsonObject makeError(const QJsonValue& id, int code, const QString& message);

    static constexpr const char* JSONRPC_VERSION = "2.0";
    static constexpr const char* MCP_VERSION = "2024-11-05";

    static constexpr int PARSE_ERROR = -32700;
    static constexpr int INVALID_REQUEST = -32600;
    static constexpr int METHOD_NOT_FOUND = -32601;
    static constexpr int INVALID_PARAMS = -32602;
    static constexpr int INTERNAL_ERROR = -32603;
    static constexpr int SERVER_ERROR = -32000;

private:
    QJsonObject handleInitialize(const QJsonObject& params);
    QJsonObject handleListTools(const QJsonObject& params);
    void handleCallTool(const QJsonValue& id, const QJsonObject& params,
                        const std::shared_ptr<SessionChannel>& channel);

    static void writeMessage(const std::shared_ptr<SessionChannel>& channel, const QJsonObject& message);

private:
    ToolDispatcher m_dispatcher;

    QString m_serverName;
    QString m_serverVersion;
    QJsonObject m_capabilities;
    bool m_initialized;
};

} // namespace LangMcp

#endif // MCPSERVER_SSE_H
