#include "tool_registry.h"
#include <cmath>

namespace LangMcp {

QJsonObject SchemaProperty::toJsonSchema() const
{
    QJsonObject schema{{"type", type}};
    if (!description.isEmpty()) {
        schema["description"] = description;
    }
    if (!defaultValue.isUndefined()) {
        schema["default"] = defaultValue;
    }

    if (type == "object") {
        QJsonObject props;
        QJsonArray required;
        for (const auto& child : properties) {
            props[child.name] = child.toJsonSchema();
            if (child.required) {
                required.append(child.name);
            }
        }
        schema["properties"] = props;
        if (!required.isEmpty()) {
            schema["required"] = required;
        }
    }

    return schema;
}

QJsonObject ToolDescriptor::toJson() const
{
    return QJsonObject{
        {"name", name},
        {"description", description},
        {"inputSchema", inputContract.toJsonSchema()}
    };
}

static QString joinPath(const QString& parent, const QString& name)
{
    return parent.isEmpty() ? name : parent + "." + name;
}

// A missing object is reported by its first required leaf, so a caller
// omitting textDocument reads "textDocument.uri is required."
static QString firstRequiredPath(const SchemaProperty& property, const QString& path)
{
    if (property.type == "object") {
        for (const auto& child : property.properties) {
            if (child.required) {
                return firstRequiredPath(child, joinPath(path, child.name));
            }
        }
    }
    return path;
}

static bool matchesType(const QString& type, const QJsonValue& value)
{
    if (type == "object") {
        return value.isObject();
    } else if (type == "string") {
        return value.isString();
    } else if (type == "number") {
        return value.isDouble();
    } else if (type == "integer") {
        return value.isDouble() && std::floor(value.toDouble()) == value.toDouble();
    } else if (type == "boolean") {
        return value.isBool();
    } else if (type == "array") {
        return value.isArray();
    }
    return true;
}

static QString validateNode(const SchemaProperty& property, const QJsonValue& value, const QString& path)
{
    if (!matchesType(property.type, value)) {
        QString article = QString("aeiou").contains(property.type.left(1)) ? "an" : "a";
        return QString("%1 must be %2 %3.").arg(path.isEmpty() ? "arguments" : path, article, property.type);
    }

    if (property.type != "object") {
        return QString();
    }

    QJsonObject obj = value.toObject();
    for (const auto& child : property.properties) {
        QString childPath = joinPath(path, child.name);
        QJsonValue childValue = obj.value(child.name);

        if (childValue.isUndefined() || childValue.isNull()) {
            if (child.required) {
                return QString("%1 is required.").arg(firstRequiredPath(child, childPath));
            }
            continue;
        }

        QString error = validateNode(child, childValue, childPath);
        if (!error.isEmpty()) {
            return error;
        }
    }

    return QString();
}

QString validateToolArguments(const SchemaProperty& contract, const QJsonValue& arguments)
{
    return validateNode(contract, arguments, QString());
}

ToolRegistry::ToolRegistry(const QList<ToolDescriptor>& tools)
    : m_tools(tools)
{
}

const ToolDescriptor* ToolRegistry::find(const QString& name) const
{
    for (const auto& tool : m_tools) {
        if (tool.name == name) {
            return &tool;
        }
    }
    return nullptr;
}

QJsonArray ToolRegistry::toJson() const
{
    QJsonArray tools;
    for (const auto& tool : m_tools) {
        tools.append(tool.toJson());
    }
    return tools;
}

ToolRegistry ToolRegistry::createDefault()
{
    SchemaProperty uri{"uri", "string", "URI of the document (file:///path/to/file format)", true, QJsonValue::Undefined, {}};
    SchemaProperty textDocument{"textDocument", "object", "The document containing the symbol", true, QJsonValue::Undefined, {uri}};

    SchemaProperty line{"line", "number", "Zero-based line number", true, QJsonValue::Undefined, {}};
    SchemaProperty character{"character", "number", "Zero-based character position", true, QJsonValue::Undefined, {}};
    SchemaProperty position{"position", "object", "The position of the symbol", true, QJsonValue::Undefined, {line, character}};

    SchemaProperty includeDeclaration{"includeDeclaration", "boolean",
                                      "Whether to include the declaration of the symbol in the results",
                                      false, QJsonValue(true), {}};
    SchemaProperty context{"context", "object", "Additional context for the request", false, QJsonValue::Undefined, {includeDeclaration}};

    SchemaProperty root{QString(), "object", QString(), true, QJsonValue::Undefined, {textDocument, position, context}};

    ToolDescriptor findUsages{
        kFindUsagesTool,
        "Finds all references to a symbol at a specified location in code. "
        "This tool helps you identify where functions, variables, types, or other symbols are used throughout the codebase. "
        "It returns a list of all locations where the symbol is referenced, including: \n"
        "- File path of each reference\n"
        "- Line and character position\n"
        "- A preview of the line containing the reference\n\n"
        "This is useful for understanding code dependencies, planning refactoring, or tracing how a particular symbol is used.",
        root
    };

    return ToolRegistry(QList<ToolDescriptor>{findUsages});
}

} // namespace LangMcp
