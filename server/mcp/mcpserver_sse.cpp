#include "mcpserver_sse.h"
#include "shared/common.h"
#include "shared/langmcplogger.h"
#include <QJsonArray>
#include <QJsonDocument>

namespace LangMcp {

static QString idToString(const QJsonValue& id)
{
    if (id.isDouble()) {
        return QString::number(id.toDouble());
    } else if (id.isString()) {
        return id.toString();
    }
    return "null";
}

MCPServerSse::MCPServerSse(const ToolRegistry& registry, std::shared_ptr<ReferenceProvider> provider)
    : m_dispatcher(registry, std::move(provider))
    , m_serverName(LangMcpCommon::Config::MCP_SERVER_NAME)
    , m_serverVersion(LangMcpCommon::Config::MCP_SERVER_VERSION)
    , m_initialized(false)
{
    m_capabilities = QJsonObject{
        {"tools", QJsonObject{}},
        {"resources", QJsonObject{}}
    };
}

DispatchOutcome MCPServerSse::handleMessage(const QJsonObject& message,
                                            const std::shared_ptr<SessionChannel>& channel)
{
    if (message.value("jsonrpc").toString() != JSONRPC_VERSION) {
        return DispatchOutcome::failure("Invalid JSON-RPC message: jsonrpc must be \"2.0\"");
    }

    // Responses from the client to server-initiated requests; none are sent
    if (!message.contains("method")) {
        if (message.contains("result") || message.contains("error")) {
            return DispatchOutcome::success();
        }
        return DispatchOutcome::failure("Invalid JSON-RPC message: method is required");
    }

    if (!message.value("method").isString()) {
        return DispatchOutcome::failure("Invalid JSON-RPC message: method must be a string");
    }

    QString method = message.value("method").toString();
    QJsonObject params = message.value("params").toObject();
    QJsonValue id = message.value("id");
    bool isNotification = !message.contains("id");

    LangMcpLogger::instance().log(LogLevel::Debug, "mcp",
        QString("Request %1 (id %2)").arg(method, idToString(id)),
        QJsonObject{{"direction", "in"}, {"method", method}, {"id", id}});

    if (isNotification) {
        if (method == "notifications/initialized") {
            m_initialized = true;
        }
        return DispatchOutcome::success();
    }

    if (method == "initialize") {
        writeMessage(channel, makeResponse(id, handleInitialize(params)));
    } else if (method == "ping") {
        writeMessage(channel, makeResponse(id, QJsonObject{}));
    } else if (method == "tools/list") {
        writeMessage(channel, makeResponse(id, handleListTools(params)));
    } else if (method == "resources/list") {
        writeMessage(channel, makeResponse(id, QJsonObject{{"resources", QJsonArray{}}}));
    } else if (method == "tools/call") {
        handleCallTool(id, params, channel);
    } else {
        writeMessage(channel, makeError(id, METHOD_NOT_FOUND, QString("Method not found: %1").arg(method)));
    }

    return DispatchOutcome::success();
}

QJsonObject MCPServerSse::handleInitialize(const QJsonObject& params)
{
    QString clientName = params.value("clientInfo").toObject().value("name").toString();
    if (!clientName.isEmpty()) {
        LangMcpLogger::instance().log(LogLevel::Info, "mcp",
            QString("Client '%1' initializing (protocol %2)")
            .arg(clientName, params.value("protocolVersion").toString()));
    }

    return QJsonObject{
        {"protocolVersion", MCP_VERSION},
        {"capabilities", m_capabilities},
        {"serverInfo", QJsonObject{
            {"name", m_serverName},
            {"version", m_serverVersion}
        }}
    };
}

QJsonObject MCPServerSse::handleListTools(const QJsonObject& params)
{
    Q_UNUSED(params);
    return QJsonObject{{"tools", m_dispatcher.registry().toJson()}};
}

void MCPServerSse::handleCallTool(const QJsonValue& id, const QJsonObject& params,
                                  const std::shared_ptr<SessionChannel>& channel)
{
    if (!params.value("name").isString()) {
        writeMessage(channel, makeError(id, INVALID_PARAMS, "Invalid params: name is required"));
        return;
    }

    QString toolName = params.value("name").toString();
    LangMcpLogger::instance().log(LogLevel::Info, "mcp", QString("Calling tool: %1").arg(toolName),
                                  QJsonObject{{"tool", toolName}, {"id", id}});

    // The result may arrive after the channel is gone; writeMessage drops it then
    std::shared_ptr<SessionChannel> sink = channel;
    m_dispatcher.invoke(toolName, params.value("arguments"), [id, toolName, sink](const ToolResult& result) {
        if (result.isError) {
            LangMcpLogger::instance().log(LogLevel::Warning, "mcp",
                QString("Tool %1 failed (%2): %3")
                .arg(toolName, QString::fromLatin1(toolErrorKindToString(result.errorKind)), result.text),
                QJsonObject{{"tool", toolName}, {"id", id}, {"isError", true}});
        }
        writeMessage(sink, makeResponse(id, result.toJson()));
    });
}

QJsonObject MCPServerSse::makeResponse(const QJsonValue& id, const QJsonObject& result)
{
    return QJsonObject{
        {"jsonrpc", JSONRPC_VERSION},
        {"id", id},
        {"result", result}
    };
}

QJsonObject MCPServerSse::makeError(const QJsonValue& id, int code, const QString& message)
{
    return QJsonObject{
        {"jsonrpc", JSONRPC_VERSION},
        {"id", id},
        {"error", QJsonObject{
            {"code", code},
            {"message", message}
        }}
    };
}

void MCPServerSse::writeMessage(const std::shared_ptr<SessionChannel>& channel, const QJsonObject& message)
{
    QJsonValue id = message.value("id");
    if (!channel || !channel->send(message)) {
        LangMcpLogger::instance().log(LogLevel::Warning, "mcp",
            QString("Dropping response for id %1: session channel is closed").arg(idToString(id)),
            QJsonObject{{"direction", "dropped"}, {"id", id}});
        return;
    }

    LangMcpLogger::instance().log(LogLevel::Debug, "mcp",
        QString("Response sent for id %1").arg(idToString(id)),
        QJsonObject{{"direction", "out"}, {"id", id}, {"session", channel->sessionId()}});
}

} // namespace LangMcp
