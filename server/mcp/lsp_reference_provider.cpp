#include "lsp_reference_provider.h"
#include "lsp_framing.h"
#include "shared/langmcplogger.h"
#include <QCoreApplication>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QSignalBlocker>
#include <QUrl>

namespace LangMcp {

static void lspLog(LogLevel level, const QString& message)
{
    LangMcpLogger::instance().log(level, "lsp", message);
}

LspReferenceProvider::LspReferenceProvider(const LspServerConfig& config, QObject* parent)
    : QObject(parent)
    , m_config(config)
    , m_process(new QProcess(this))
    , m_state(ServerState::Stopped)
    , m_nextRequestId(1)
    , m_nextLookupId(1)
{
    m_process->setProcessChannelMode(QProcess::SeparateChannels);
    if (!m_config.workspacePath.isEmpty()) {
        m_process->setWorkingDirectory(m_config.workspacePath);
    }

    connect(m_process, &QProcess::readyReadStandardOutput, this, &LspReferenceProvider::handleStandardOutput);
    connect(m_process, &QProcess::readyReadStandardError, this, &LspReferenceProvider::handleStandardError);
    connect(m_process, &QProcess::finished, this, &LspReferenceProvider::handleProcessFinished);
    connect(m_process, &QProcess::errorOccurred, this, &LspReferenceProvider::handleProcessError);
}

LspReferenceProvider::~LspReferenceProvider()
{
    shutdown();
}

bool LspReferenceProvider::isRunning() const
{
    return m_process->state() != QProcess::NotRunning;
}

void LspReferenceProvider::findReferences(const ReferenceQuery& query, ReferencesCallback callback)
{
    int lookupId = m_nextLookupId++;

    Lookup lookup;
    lookup.callback = std::move(callback);
    if (m_config.lookupTimeoutMs > 0) {
        lookup.timer = new QTimer(this);
        lookup.timer->setSingleShot(true);
        connect(lookup.timer, &QTimer::timeout, this, [this, lookupId]() {
            lspLog(LogLevel::Warning, QString("Reference lookup %1 timed out after %2 ms")
                .arg(lookupId).arg(m_config.lookupTimeoutMs));
            completeLookup(lookupId, ProviderResult::failure(
                QString("Language server did not answer within %1 ms").arg(m_config.lookupTimeoutMs)));
        });
        lookup.timer->start(m_config.lookupTimeoutMs);
    }
    m_lookups.insert(lookupId, lookup);

    switch (m_state) {
        case ServerState::Ready:
            runLookup(lookupId, query);
            break;
        case ServerState::Initializing:
            m_waitingForInitialize.append({lookupId, query});
            break;
        case ServerState::Stopped:
            m_waitingForInitialize.append({lookupId, query});
            startServer();
            break;
    }
}

void LspReferenceProvider::startServer()
{
    m_readBuffer.clear();
    m_openDocuments.clear();
    m_state = ServerState::Initializing;

    lspLog(LogLevel::Info, QString("Starting language server: %1 %2")
        .arg(m_config.command, m_config.arguments.join(' ')));
    m_process->start(m_config.command, m_config.arguments);

    // A start failure reports through errorOccurred and may already have reset the state
    if (m_state != ServerState::Initializing) {
        return;
    }

    QJsonObject params{
        {"processId", static_cast<qint64>(QCoreApplication::applicationPid())},
        {"rootUri", m_config.rootUri.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(m_config.rootUri)},
        {"capabilities", QJsonObject{
            {"textDocument", QJsonObject{
                {"references", QJsonObject{{"dynamicRegistration", false}}},
                {"synchronization", QJsonObject{{"didSave", false}}}
            }},
            {"workspace", QJsonObject{{"configuration", true}}}
        }},
        {"clientInfo", QJsonObject{{"name", "langmcp"}}}
    };
    if (!m_config.rootUri.isEmpty()) {
        params["workspaceFolders"] = QJsonArray{
            QJsonObject{
                {"uri", m_config.rootUri},
                {"name", QFileInfo(m_config.workspacePath).fileName()}
            }
        };
    }

    sendRequest("initialize", params, [this](const QJsonValue& result, const QString& error) {
        Q_UNUSED(result);
        if (!error.isEmpty()) {
            lspLog(LogLevel::Error, QString("Language server initialize failed: %1").arg(error));
            failAll(QString("Language server initialize failed: %1").arg(error));
            m_process->kill();
            return;
        }

        sendNotification("initialized", QJsonObject{});
        m_state = ServerState::Ready;
        lspLog(LogLevel::Info, "Language server initialized");
        emit serverStarted();

        QList<QPair<int, ReferenceQuery>> waiting;
        waiting.swap(m_waitingForInitialize);
        for (const auto& entry : waiting) {
            if (m_lookups.contains(entry.first)) {
                runLookup(entry.first, entry.second);
            }
        }
    });
}

void LspReferenceProvider::runLookup(int lookupId, const ReferenceQuery& query)
{
    openDocument(query.location.uri);

    QJsonObject params{
        {"textDocument", QJsonObject{{"uri", query.location.uri}}},
        {"position", QJsonObject{
            {"line", query.location.line},
            {"character", query.location.character}
        }},
        {"context", QJsonObject{{"includeDeclaration", query.includeDeclaration}}}
    };

    int requestId = sendRequest("textDocument/references", params, [this, lookupId](const QJsonValue& result, const QString& error) {
        if (!error.isEmpty()) {
            completeLookup(lookupId, ProviderResult::failure(error));
            return;
        }

        QList<ReferenceLocation> locations;
        const QJsonArray entries = result.toArray();
        for (const auto& entry : entries) {
            ReferenceLocation location;
            if (referenceLocationFromJson(entry, location)) {
                locations.append(location);
            } else {
                lspLog(LogLevel::Warning, QString("Skipping malformed location: %1")
                    .arg(QString::fromUtf8(QJsonDocument(entry.toObject()).toJson(QJsonDocument::Compact))));
            }
        }
        completeLookup(lookupId, ProviderResult::success(locations));
    });

    auto it = m_lookups.find(lookupId);
    if (it != m_lookups.end()) {
        it->requestId = requestId;
    }
}

void LspReferenceProvider::completeLookup(int lookupId, const ProviderResult& result)
{
    auto it = m_lookups.find(lookupId);
    if (it == m_lookups.end()) {
        // Already timed out or failed
        return;
    }

    Lookup lookup = it.value();
    m_lookups.erase(it);

    // A late answer from the server then finds no callback and is dropped
    if (lookup.requestId != 0) {
        m_pendingRequests.remove(lookup.requestId);
    }

    if (lookup.timer) {
        lookup.timer->stop();
        lookup.timer->deleteLater();
    }
    if (lookup.callback) {
        lookup.callback(result);
    }
}

void LspReferenceProvider::failAll(const QString& reason)
{
    m_pendingRequests.clear();
    m_waitingForInitialize.clear();

    const QList<int> ids = m_lookups.keys();
    for (int lookupId : ids) {
        completeLookup(lookupId, ProviderResult::failure(reason));
    }
}

void LspReferenceProvider::openDocument(const QString& uri)
{
    if (m_openDocuments.contains(uri)) {
        return;
    }

    QUrl url(QUrl::fromPercentEncoding(uri.toUtf8()));
    QFile file(url.toLocalFile());
    if (!url.isLocalFile() || !file.open(QIODevice::ReadOnly)) {
        // The server may still know the document from its own index
        lspLog(LogLevel::Debug, QString("Not opening %1: unreadable").arg(uri));
        return;
    }

    sendNotification("textDocument/didOpen", QJsonObject{
        {"textDocument", QJsonObject{
            {"uri", uri},
            {"languageId", languageIdForUri(uri)},
            {"version", 1},
            {"text", QString::fromUtf8(file.readAll())}
        }}
    });
    m_openDocuments.insert(uri);
}

int LspReferenceProvider::sendRequest(const QString& method, const QJsonValue& params, ResponseCallback callback)
{
    int id = m_nextRequestId++;
    m_pendingRequests.insert(id, std::move(callback));

    writeMessage(QJsonObject{
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", method},
        {"params", params}
    });
    return id;
}

void LspReferenceProvider::sendNotification(const QString& method, const QJsonValue& params)
{
    writeMessage(QJsonObject{
        {"jsonrpc", "2.0"},
        {"method", method},
        {"params", params}
    });
}

void LspReferenceProvider::writeMessage(const QJsonObject& message)
{
    lspLog(LogLevel::Debug, QString("--> %1").arg(message.value("method").toString("response")));
    if (m_process->write(encodeLspMessage(message)) == -1) {
        lspLog(LogLevel::Warning, QString("Write to language server failed: %1").arg(m_process->errorString()));
    }
}

void LspReferenceProvider::handleStandardOutput()
{
    m_readBuffer.append(m_process->readAllStandardOutput());

    for (;;) {
        QJsonObject message;
        QString error;
        FrameStatus status = decodeLspMessage(m_readBuffer, message, &error);
        if (status == FrameStatus::Incomplete) {
            return;
        }
        if (status == FrameStatus::Malformed) {
            lspLog(LogLevel::Warning, QString("Malformed message from language server: %1").arg(error));
            continue;
        }
        handleMessage(message);
    }
}

void LspReferenceProvider::handleStandardError()
{
    QByteArray output = m_process->readAllStandardError();
    const QList<QByteArray> lines = output.split('\n');
    for (const auto& line : lines) {
        if (!line.trimmed().isEmpty()) {
            lspLog(LogLevel::Debug, QString("[stderr] %1").arg(QString::fromUtf8(line.trimmed())));
        }
    }
}

void LspReferenceProvider::handleMessage(const QJsonObject& message)
{
    bool hasId = message.contains("id");
    bool hasMethod = message.contains("method");

    if (hasId && hasMethod) {
        answerServerRequest(message);
        return;
    }

    if (hasMethod) {
        QString method = message.value("method").toString();
        if (method == "window/logMessage" || method == "window/showMessage") {
            lspLog(LogLevel::Debug, message.value("params").toObject().value("message").toString());
        }
        return;
    }

    if (!hasId) {
        return;
    }

    int id = message.value("id").toInt(-1);
    auto it = m_pendingRequests.find(id);
    if (it == m_pendingRequests.end()) {
        lspLog(LogLevel::Debug, QString("Response for unknown request %1").arg(id));
        return;
    }
    ResponseCallback callback = it.value();
    m_pendingRequests.erase(it);

    if (message.contains("error")) {
        QJsonObject error = message.value("error").toObject();
        callback(QJsonValue(), QString("%1 (code %2)")
            .arg(error.value("message").toString()).arg(error.value("code").toInt()));
    } else {
        callback(message.value("result"), QString());
    }
}

// Requests from the server are answered with neutral results so it never waits on us
void LspReferenceProvider::answerServerRequest(const QJsonObject& request)
{
    QString method = request.value("method").toString();
    QJsonValue result = QJsonValue::Null;

    if (method == "workspace/configuration") {
        QJsonArray items = request.value("params").toObject().value("items").toArray();
        QJsonArray nulls;
        for (int i = 0; i < items.size(); ++i) {
            nulls.append(QJsonValue::Null);
        }
        result = nulls;
    } else if (method == "workspace/workspaceFolders" && !m_config.rootUri.isEmpty()) {
        result = QJsonArray{
            QJsonObject{
                {"uri", m_config.rootUri},
                {"name", QFileInfo(m_config.workspacePath).fileName()}
            }
        };
    }

    writeMessage(QJsonObject{
        {"jsonrpc", "2.0"},
        {"id", request.value("id")},
        {"result", result}
    });
}

void LspReferenceProvider::handleProcessFinished(int exitCode, QProcess::ExitStatus exitStatus)
{
    lspLog(exitStatus == QProcess::NormalExit ? LogLevel::Info : LogLevel::Warning,
           QString("Language server exited (code %1, %2)")
           .arg(exitCode).arg(exitStatus == QProcess::NormalExit ? "normal" : "crashed"));

    m_state = ServerState::Stopped;
    m_readBuffer.clear();
    m_openDocuments.clear();
    failAll("Language server exited");
}

void LspReferenceProvider::handleProcessError(QProcess::ProcessError error)
{
    if (error != QProcess::FailedToStart) {
        lspLog(LogLevel::Warning, QString("Language server process error: %1").arg(m_process->errorString()));
        return;
    }

    lspLog(LogLevel::Error, QString("Failed to start language server '%1': %2")
        .arg(m_config.command, m_process->errorString()));
    m_state = ServerState::Stopped;
    failAll(QString("Failed to start language server '%1'").arg(m_config.command));
}

void LspReferenceProvider::shutdown()
{
    failAll("Reference provider shutting down");

    if (m_process->state() == QProcess::NotRunning) {
        m_state = ServerState::Stopped;
        return;
    }

    // The exit is deliberate; keep finished() from failing lookups a second time
    QSignalBlocker blocker(m_process);

    if (m_state == ServerState::Ready) {
        sendRequest("shutdown", QJsonValue::Null, [](const QJsonValue&, const QString&) {});
        sendNotification("exit", QJsonValue::Null);
        m_process->closeWriteChannel();
        if (!m_process->waitForFinished(SHUTDOWN_TIMEOUT_MS)) {
            m_process->kill();
            m_process->waitForFinished(SHUTDOWN_TIMEOUT_MS);
        }
    } else {
        m_process->kill();
        m_process->waitForFinished(SHUTDOWN_TIMEOUT_MS);
    }

    m_state = ServerState::Stopped;
    m_pendingRequests.clear();
    lspLog(LogLevel::Info, "Language server stopped");
}

QString LspReferenceProvider::languageIdForUri(const QString& uri)
{
    QString suffix = QFileInfo(QUrl(uri).path()).suffix().toLower();

    static const QMap<QString, QString> languages = {
        {"c", "c"},
        {"h", "cpp"},
        {"cc", "cpp"}, {"cpp", "cpp"}, {"cxx", "cpp"}, {"hh", "cpp"}, {"hpp", "cpp"}, {"hxx", "cpp"},
        {"m", "objective-c"}, {"mm", "objective-cpp"},
        {"ts", "typescript"}, {"tsx", "typescriptreact"},
        {"js", "javascript"}, {"jsx", "javascriptreact"}, {"mjs", "javascript"},
        {"py", "python"},
        {"rs", "rust"},
        {"go", "go"},
        {"java", "java"},
        {"cs", "csharp"},
        {"rb", "ruby"},
        {"ex", "elixir"}, {"exs", "elixir"}
    };

    return languages.value(suffix, "plaintext");
}

} // namespace LangMcp
