#ifndef LSP_REFERENCE_PROVIDER_H
#define LSP_REFERENCE_PROVIDER_H

#include <QObject>
#include <QProcess>
#include <QTimer>
#include <QJsonObject>
#include <QJsonValue>
#include <QStringList>
#include <QMap>
#include <QSet>
#include <QList>
#include <functional>
#include "reference_provider.h"

namespace LangMcp {

struct LspServerConfig {
    QString command;
    QStringList arguments;
    QString workspacePath;
    QString rootUri;
    int lookupTimeoutMs = 30000;    // 0 = wait forever
};

/**
 * Reference provider backed by an external language server spoken to over
 * stdio. The server is started on the first lookup and restarted on the
 * next lookup after it exits.
 */
class LspReferenceProvider : public QObject, public ReferenceProvider
{
    Q_OBJECT

public:
    explicit LspReferenceProvider(const LspServerConfig& config, QObject* parent = nullptr);
    ~LspReferenceProvider() override;

    void findReferences(const ReferenceQuery& query, ReferencesCallback callback) override;

    bool isRunning() const;
    int pendingLookups() const { return m_lookups.size(); }
    int pendingRequests() const { return m_pendingRequests.size(); }
    qint64 serverProcessId() const { return m_process->processId(); }

    // Ask the server to exit, killing it if it does not
    void shutdown();

    static QString languageIdForUri(const QString& uri);

signals:
    void serverStarted();

private slots:
    void handleStandardOutput();
    void handleStandardError();
    void handleProcessFinished(int exitCode, QProcess::ExitStatus exitStatus);
    void handleProcessError(QProcess::ProcessError error);

private:
    using ResponseCallback = std::function<void(const QJsonValue& result, const QString& error)>;

    enum class ServerState {
        Stopped,
        Initializing,
        Ready
    };

    void startServer();
    void runLookup(int lookupId, const ReferenceQuery& query);
    void completeLookup(int lookupId, const ProviderResult& result);
    void failAll(const QString& reason);

    void openDocument(const QString& uri);
    int sendRequest(const QString& method, const QJsonValue& params, ResponseCallback callback);
    void sendNotification(const QString& method, const QJsonValue& params);
    void writeMessage(const QJsonObject& message);
    void handleMessage(const QJsonObject& message);
    void answerServerRequest(const QJsonObject& request);

    struct Lookup {
        ReferencesCallback callback;
        QTimer* timer = nullptr;
        int requestId = 0;      // textDocument/references, once sent
    };

    LspServerConfig m_config;
    QProcess* m_process;
    ServerState m_state;
    QByteArray m_readBuffer;

    int m_nextRequestId;
    int m_nextLookupId;
    QMap<int, ResponseCallback> m_pendingRequests;
    QMap<int, Lookup> m_lookups;
    QList<QPair<int, ReferenceQuery>> m_waitingForInitialize;
    QSet<QString> m_openDocuments;

    static constexpr int SHUTDOWN_TIMEOUT_MS = 1000;
};

} // namespace LangMcp

#endif // LSP_REFERENCE_PROVIDER_H
