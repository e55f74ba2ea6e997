#ifndef TOOL_DISPATCHER_H
#define TOOL_DISPATCHER_H

#include <QString>
#include <QJsonObject>
#include <QJsonValue>
#include <functional>
#include <memory>
#include <variant>
#include "tool_registry.h"
#include "reference_provider.h"

namespace LangMcp {

enum class ToolErrorKind {
    None,
    InvalidArguments,
    UnknownTool,
    ProviderFailure
};

const char* toolErrorKindToString(ToolErrorKind kind);

// The outcome of one invocation, rendered as a tools/call result
struct ToolResult {
    bool isError = false;
    QString text;
    ToolErrorKind errorKind = ToolErrorKind::None;

    static ToolResult success(const QString& text);
    static ToolResult failure(ToolErrorKind kind, const QString& message);

    QJsonObject toJson() const;
};

struct FindUsagesArguments {
    DocumentLocation location;
    bool includeDeclaration = true;
};

// One alternative per registered tool
using ToolArguments = std::variant<FindUsagesArguments>;

/**
 * Validates tool invocations against the registry and runs them.
 * Every invocation reports exactly one ToolResult through its callback;
 * failures are data, never exceptions.
 */
class ToolDispatcher
{
public:
    using ResultCallback = std::function<void(const ToolResult& result)>;

    ToolDispatcher(const ToolRegistry& registry, std::shared_ptr<ReferenceProvider> provider);

    const ToolRegistry& registry() const { return m_registry; }

    void invoke(const QString& name, const QJsonValue& arguments, ResultCallback callback);

    // Turn validated JSON into the typed arguments for the named tool.
    // Returns false and sets error when the payload does not fit.
    static bool parseArguments(const QString& name, const QJsonObject& arguments,
                               ToolArguments& out, QString& error);

private:
    void runFindUsages(const FindUsagesArguments& args, ResultCallback callback);
    static ToolResult shapeReferences(ReferenceProvider* provider,
                                      const QList<ReferenceLocation>& locations);

    ToolRegistry m_registry;
    std::shared_ptr<ReferenceProvider> m_provider;
};

} // namespace LangMcp

#endif // TOOL_DISPATCHER_H
