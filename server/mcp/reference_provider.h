#ifndef REFERENCE_PROVIDER_H
#define REFERENCE_PROVIDER_H

#include <QString>
#include <QList>
#include <functional>
#include "reference_result.h"
#include "document_preview.h"

namespace LangMcp {

struct ReferenceQuery {
    DocumentLocation location;
    bool includeDeclaration = true;
};

struct ProviderResult {
    bool ok = false;
    QList<ReferenceLocation> locations;
    QString error;

    static ProviderResult success(const QList<ReferenceLocation>& locations) { return {true, locations, QString()}; }
    static ProviderResult failure(const QString& error) { return {false, {}, error}; }
};

/**
 * The code-intelligence backend: given a document location, report every
 * reference to the symbol there.
 *
 * findReferences may complete synchronously or later from the event loop,
 * but must call the callback exactly once.
 */
class ReferenceProvider
{
public:
    using ReferencesCallback = std::function<void(const ProviderResult& result)>;

    virtual ~ReferenceProvider() = default;

    virtual void findReferences(const ReferenceQuery& query, ReferencesCallback callback) = 0;

    // Default implementation reads the line from disk
    virtual PreviewResult resolvePreview(const ReferenceLocation& location)
    {
        return readLinePreview(location.uri, location.range.start.line);
    }
};

} // namespace LangMcp

#endif // REFERENCE_PROVIDER_H
