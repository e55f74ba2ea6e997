#ifndef LANGMCP_TEST_SUPPORT_H
#define LANGMCP_TEST_SUPPORT_H

#include <QList>
#include <QSet>
#include <QJsonObject>
#include <QJsonDocument>
#include <QJsonArray>
#include <stdexcept>
#include "reference_provider.h"
#include "session_channel.h"

namespace LangMcpTest {

// Scripted capability provider
class FakeReferenceProvider : public LangMcp::ReferenceProvider
{
public:
    LangMcp::ProviderResult result = LangMcp::ProviderResult::success({});
    QSet<int> failingPreviewLines;
    bool throwOnFind = false;
    bool deferAnswer = false;

    QList<LangMcp::ReferenceQuery> queries;
    QList<ReferencesCallback> deferred;

    void findReferences(const LangMcp::ReferenceQuery& query, ReferencesCallback callback) override
    {
        queries.append(query);
        if (throwOnFind) {
            throw std::runtime_error("backend exploded");
        }
        if (deferAnswer) {
            deferred.append(callback);
            return;
        }
        callback(result);
    }

    LangMcp::PreviewResult resolvePreview(const LangMcp::ReferenceLocation& location) override
    {
        if (failingPreviewLines.contains(location.range.start.line)) {
            return LangMcp::PreviewResult::failure("document vanished");
        }
        return LangMcp::PreviewResult::success(
            QString("line %1 of %2").arg(location.range.start.line).arg(location.uri));
    }
};

// Session channel that records what is sent through it
class RecordingChannel : public LangMcp::SessionChannel
{
public:
    explicit RecordingChannel(const QString& id = "test-session") : m_id(id) {}

    QList<QJsonObject> sent;
    bool open = true;
    int closeCount = 0;

    QString sessionId() const override { return m_id; }
    bool isOpen() const override { return open; }

    bool send(const QJsonObject& message) override
    {
        if (!open) {
            return false;
        }
        sent.append(message);
        return true;
    }

    void close() override
    {
        open = false;
        closeCount++;
    }

private:
    QString m_id;
};

inline LangMcp::ReferenceLocation makeLocation(const QString& uri, int line, int character = 0, int length = 3)
{
    LangMcp::ReferenceLocation location;
    location.uri = uri;
    location.range.start = {line, character};
    location.range.end = {line, character + length};
    return location;
}

inline QJsonObject findUsagesArguments(const QString& uri, int line, int character)
{
    return QJsonObject{
        {"textDocument", QJsonObject{{"uri", uri}}},
        {"position", QJsonObject{{"line", line}, {"character", character}}}
    };
}

// Parse the text of a tools/call result back into JSON
inline QJsonArray resultArray(const QString& text)
{
    return QJsonDocument::fromJson(text.toUtf8()).array();
}

} // namespace LangMcpTest

#endif // LANGMCP_TEST_SUPPORT_H
