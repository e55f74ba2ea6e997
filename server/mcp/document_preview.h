#ifndef DOCUMENT_PREVIEW_H
#define DOCUMENT_PREVIEW_H

#include <QString>

namespace LangMcp {

struct PreviewResult {
    bool ok = false;
    QString text;
    QString error;

    static PreviewResult success(const QString& text) { return {true, text, QString()}; }
    static PreviewResult failure(const QString& error) { return {false, QString(), error}; }
};

/**
 * Read one line of a local document and trim surrounding whitespace.
 * The URI is percent-decoded before it is resolved to a path, so
 * "file:///a%20b.ts" opens "/a b.ts". Only file: URIs are supported.
 */
PreviewResult readLinePreview(const QString& uri, int line);

} // namespace LangMcp

#endif // DOCUMENT_PREVIEW_H
