#include "tool_dispatcher.h"
#include "shared/langmcplogger.h"
#include <QJsonArray>
#include <QJsonDocument>
#include <QUrl>
#include <cmath>
#include <exception>
#include <limits>

namespace LangMcp {

static const char* kFailedToFindReferences = "Failed to find references";
static const char* kNoReferencesFound = "No references found";

const char* toolErrorKindToString(ToolErrorKind kind)
{
    switch (kind) {
        case ToolErrorKind::None:             return "None";
        case ToolErrorKind::InvalidArguments: return "InvalidArguments";
        case ToolErrorKind::UnknownTool:      return "UnknownTool";
        case ToolErrorKind::ProviderFailure:  return "ProviderFailure";
    }
    return "Unknown";
}

ToolResult ToolResult::success(const QString& text)
{
    return ToolResult{false, text, ToolErrorKind::None};
}

ToolResult ToolResult::failure(ToolErrorKind kind, const QString& message)
{
    return ToolResult{true, message, kind};
}

QJsonObject ToolResult::toJson() const
{
    QString body = isError ? QString("Error: %1").arg(text) : text;
    return QJsonObject{
        {"content", QJsonArray{
            QJsonObject{
                {"type", "text"},
                {"text", body}
            }
        }},
        {"isError", isError}
    };
}

// Range-check before any conversion so huge JSON numbers never reach an int cast
static bool toNonNegativeInt(const QJsonValue& value, int& out)
{
    double number = value.toDouble(-1);
    if (!std::isfinite(number) || number < 0
        || number > static_cast<double>(std::numeric_limits<int>::max())
        || std::floor(number) != number) {
        return false;
    }
    out = static_cast<int>(number);
    return true;
}

ToolDispatcher::ToolDispatcher(const ToolRegistry& registry, std::shared_ptr<ReferenceProvider> provider)
    : m_registry(registry)
    , m_provider(std::move(provider))
{
}

bool ToolDispatcher::parseArguments(const QString& name, const QJsonObject& arguments,
                                    ToolArguments& out, QString& error)
{
    if (name != kFindUsagesTool) {
        error = QString("Unknown tool: %1").arg(name);
        return false;
    }

    FindUsagesArguments args;
    QString uri = arguments.value("textDocument").toObject().value("uri").toString();
    QUrl parsed(uri, QUrl::StrictMode);
    if (uri.isEmpty()) {
        error = "textDocument.uri is required.";
        return false;
    }
    if (!parsed.isValid() || parsed.scheme().isEmpty()) {
        error = QString("textDocument.uri is not a valid URI: %1").arg(uri);
        return false;
    }

    QJsonObject position = arguments.value("position").toObject();
    int line = 0;
    int character = 0;
    if (!toNonNegativeInt(position.value("line"), line)) {
        error = "position.line must be a non-negative integer.";
        return false;
    }
    if (!toNonNegativeInt(position.value("character"), character)) {
        error = "position.character must be a non-negative integer.";
        return false;
    }

    args.location.uri = uri;
    args.location.line = line;
    args.location.character = character;
    args.includeDeclaration = arguments.value("context").toObject().value("includeDeclaration").toBool(true);

    out = args;
    return true;
}

void ToolDispatcher::invoke(const QString& name, const QJsonValue& arguments, ResultCallback callback)
{
    if (!arguments.isObject()) {
        callback(ToolResult::failure(ToolErrorKind::InvalidArguments,
                                     "Invalid arguments: arguments must be an object."));
        return;
    }

    const ToolDescriptor* tool = m_registry.find(name);
    if (!tool) {
        callback(ToolResult::failure(ToolErrorKind::UnknownTool, QString("Unknown tool: %1").arg(name)));
        return;
    }

    QString error = validateToolArguments(tool->inputContract, arguments);
    ToolArguments parsed;
    bool valid = error.isEmpty() && parseArguments(name, arguments.toObject(), parsed, error);
    if (!valid) {
        callback(ToolResult::failure(ToolErrorKind::InvalidArguments,
                                     QString("Invalid arguments: %1").arg(error)));
        return;
    }

    std::visit([this, &callback](const auto& args) {
        runFindUsages(args, callback);
    }, parsed);
}

void ToolDispatcher::runFindUsages(const FindUsagesArguments& args, ResultCallback callback)
{
    if (!m_provider) {
        LangMcpLogger::instance().log(LogLevel::Error, "mcp", "find_usages called without a reference provider");
        callback(ToolResult::failure(ToolErrorKind::ProviderFailure, kFailedToFindReferences));
        return;
    }

    // The provider must answer once; a second answer is logged and ignored
    auto answered = std::make_shared<bool>(false);
    QString uri = args.location.uri;

    // Providers keep this callback until they answer, so it must not own them
    std::weak_ptr<ReferenceProvider> provider = m_provider;
    auto onResult = [provider, answered, uri, callback](const ProviderResult& result) {
        if (*answered) {
            LangMcpLogger::instance().log(LogLevel::Warning, "mcp",
                QString("Reference provider answered twice for %1, ignoring").arg(uri));
            return;
        }
        *answered = true;

        if (!result.ok) {
            LangMcpLogger::instance().log(LogLevel::Error, "mcp",
                QString("Reference lookup failed for %1: %2").arg(uri, result.error));
            callback(ToolResult::failure(ToolErrorKind::ProviderFailure, kFailedToFindReferences));
            return;
        }

        callback(shapeReferences(provider.lock().get(), result.locations));
    };

    ReferenceQuery query{args.location, args.includeDeclaration};
    try {
        m_provider->findReferences(query, onResult);
    } catch (const std::exception& e) {
        if (!*answered) {
            *answered = true;
            LangMcpLogger::instance().log(LogLevel::Error, "mcp",
                QString("Reference provider threw for %1: %2").arg(uri, QString::fromUtf8(e.what())));
            callback(ToolResult::failure(ToolErrorKind::ProviderFailure, kFailedToFindReferences));
        }
    }
}

ToolResult ToolDispatcher::shapeReferences(ReferenceProvider* provider,
                                           const QList<ReferenceLocation>& locations)
{
    if (locations.isEmpty()) {
        return ToolResult::success(kNoReferencesFound);
    }

    QList<ReferenceResult> results;
    results.reserve(locations.size());

    for (const auto& location : locations) {
        PreviewResult preview = PreviewResult::failure("reference provider is gone");
        try {
            if (provider) {
                preview = provider->resolvePreview(location);
            }
        } catch (const std::exception& e) {
            preview = PreviewResult::failure(QString::fromUtf8(e.what()));
        }
        if (!preview.ok) {
            LangMcpLogger::instance().log(LogLevel::Warning, "mcp",
                QString("Preview unavailable for %1:%2: %3")
                .arg(location.uri).arg(location.range.start.line).arg(preview.error));
        }
        results.append({location.uri, location.range, preview.ok ? preview.text : QString(kPreviewUnavailable)});
    }

    QJsonDocument doc(referencesToJson(results));
    return ToolResult::success(QString::fromUtf8(doc.toJson(QJsonDocument::Compact)));
}

} // namespace LangMcp
