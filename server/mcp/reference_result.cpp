#include "reference_result.h"

namespace LangMcp {

QJsonObject Position::toJson() const
{
    return QJsonObject{
        {"line", line},
        {"character", character}
    };
}

QJsonObject Range::toJson() const
{
    return QJsonObject{
        {"start", start.toJson()},
        {"end", end.toJson()}
    };
}

QJsonObject ReferenceResult::toJson() const
{
    return QJsonObject{
        {"uri", uri},
        {"range", range.toJson()},
        {"preview", preview}
    };
}

static bool positionFromJson(const QJsonValue& value, Position& out)
{
    if (!value.isObject()) {
        return false;
    }
    QJsonObject obj = value.toObject();
    if (!obj.value("line").isDouble() || !obj.value("character").isDouble()) {
        return false;
    }
    out.line = obj.value("line").toInt();
    out.character = obj.value("character").toInt();
    return out.line >= 0 && out.character >= 0;
}

bool referenceLocationFromJson(const QJsonValue& value, ReferenceLocation& out)
{
    if (!value.isObject()) {
        return false;
    }
    QJsonObject obj = value.toObject();
    if (!obj.value("uri").isString()) {
        return false;
    }

    QJsonObject range = obj.value("range").toObject();
    ReferenceLocation location;
    location.uri = obj.value("uri").toString();
    if (!positionFromJson(range.value("start"), location.range.start) ||
        !positionFromJson(range.value("end"), location.range.end)) {
        return false;
    }

    out = location;
    return true;
}

QJsonArray referencesToJson(const QList<ReferenceResult>& results)
{
    QJsonArray array;
    for (const auto& result : results) {
        array.append(result.toJson());
    }
    return array;
}

} // namespace LangMcp
