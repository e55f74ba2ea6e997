#ifndef REFERENCE_RESULT_H
#define REFERENCE_RESULT_H

#include <QString>
#include <QJsonObject>
#include <QJsonArray>
#include <QList>

namespace LangMcp {

// Substituted for a preview that could not be resolved
constexpr const char* kPreviewUnavailable = "Preview unavailable";

// Zero-based, as in LSP
struct Position {
    int line = 0;
    int character = 0;

    QJsonObject toJson() const;
    bool operator==(const Position& other) const {
        return line == other.line && character == other.character;
    }
};

struct Range {
    Position start;
    Position end;

    QJsonObject toJson() const;
    bool operator==(const Range& other) const {
        return start == other.start && end == other.end;
    }
};

// A (document, position) pair handed to the capability provider
struct DocumentLocation {
    QString uri;
    int line = 0;
    int character = 0;
};

// A raw location as the capability provider returns it
struct ReferenceLocation {
    QString uri;
    Range range;
};

// A location shaped for the caller, with its one-line preview
struct ReferenceResult {
    QString uri;
    Range range;
    QString preview;

    QJsonObject toJson() const;
};

// Parse an LSP Location object ({uri, range}). Returns false if the shape is wrong.
bool referenceLocationFromJson(const QJsonValue& value, ReferenceLocation& out);

QJsonArray referencesToJson(const QList<ReferenceResult>& results);

} // namespace LangMcp

#endif // REFERENCE_RESULT_H
