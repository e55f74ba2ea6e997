#ifndef TOOL_REGISTRY_H
#define TOOL_REGISTRY_H

#include <QString>
#include <QList>
#include <QJsonObject>
#include <QJsonArray>
#include <QJsonValue>

namespace LangMcp {

constexpr const char* kFindUsagesTool = "find_usages";

/**
 * One node of a tool's input contract. Serialized as a JSON Schema
 * fragment; object nodes carry their children in `properties`.
 */
struct SchemaProperty {
    QString name;
    QString type;           // "object", "string", "number", "integer", "boolean"
    QString description;
    bool required = false;
    QJsonValue defaultValue = QJsonValue::Undefined;
    QList<SchemaProperty> properties;

    QJsonObject toJsonSchema() const;
};

struct ToolDescriptor {
    QString name;
    QString description;
    SchemaProperty inputContract;

    QJsonObject toJson() const;
};

/**
 * Check a payload against a contract. Returns an empty string when the
 * payload conforms, otherwise a message naming the offending field path,
 * e.g. "textDocument.uri is required."
 */
QString validateToolArguments(const SchemaProperty& contract, const QJsonValue& arguments);

class ToolRegistry
{
public:
    ToolRegistry() = default;
    explicit ToolRegistry(const QList<ToolDescriptor>& tools);

    // The registry the server advertises: find_usages only
    static ToolRegistry createDefault();

    QList<ToolDescriptor> listTools() const { return m_tools; }
    const ToolDescriptor* find(const QString& name) const;
    QJsonArray toJson() const;

private:
    QList<ToolDescriptor> m_tools;
};

} // namespace LangMcp

#endif // TOOL_REGISTRY_H
