#include "langmcplogger.h"
#include <QDateTime>
#include <QDir>
#include <QStandardPaths>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTextStream>
#include <QDebug>
#include <QCoreApplication>

std::unique_ptr<LangMcpLogger> LangMcpLogger::s_instance = nullptr;
QMutex LangMcpLogger::s_instanceMutex;

LangMcpLogger::LangMcpLogger() : QObject(nullptr) {
}

LangMcpLogger::~LangMcpLogger() {
    flush();
    closeLogFiles();
}

void LangMcpLogger::initialize(const QString& appName) {
    LangMcpLoggerConfig config;
    config.appName = appName;

    if (appName == "server") {
        config.logFiles = {
            {"server.log", "server", false},
            {"mcp.log", "mcp", true},   // JSON format for protocol traffic
            {"lsp.log", "lsp", false}
        };
    } else {
        config.logFiles = {
            {"app.log", "default", false}
        };
    }

    config.baseLogDir = getBaseLogDir();

    initialize(config);
}

void LangMcpLogger::initialize(const LangMcpLoggerConfig& config) {
    QMutexLocker locker(&s_instanceMutex);

    if (s_instance) {
        qWarning() << "LangMcpLogger already initialized, ignoring re-initialization";
        return;
    }

    s_instance = std::make_unique<LangMcpLogger>();
    s_instance->initializeWithConfig(config);
}

LangMcpLogger& LangMcpLogger::instance() {
    QMutexLocker locker(&s_instanceMutex);

    if (!s_instance) {
        qFatal("LangMcpLogger not initialized! Call LangMcpLogger::initialize() first.");
    }

    return *s_instance;
}

bool LangMcpLogger::isInitialized() {
    QMutexLocker locker(&s_instanceMutex);
    return s_instance != nullptr;
}

void LangMcpLogger::initializeWithConfig(const LangMcpLoggerConfig& config) {
    m_config = config;

    if (!m_config.logFiles.isEmpty()) {
        m_defaultCategory = m_config.logFiles.first().category;
    } else {
        m_defaultCategory = "default";
    }

    if (!m_config.logFiles.isEmpty()) {
        m_sessionPath = createSessionFolder();
        openLogFiles();
    }

    log(LogLevel::Info, m_defaultCategory,
        QString("LangMcpLogger initialized for '%1' in session: %2")
        .arg(m_config.appName)
        .arg(m_sessionPath.isEmpty() ? "(console only)" : m_sessionPath));
}

QString LangMcpLogger::createSessionFolder() {
    QString appDir = QString("%1/%2").arg(m_config.baseLogDir).arg(m_config.appName);
    QDir dir(appDir);

    QString timestamp = QDateTime::currentDateTime().toString("yyyy-MM-dd_HHmmss");
    QString sessionName = QString("%1_p%2").arg(timestamp).arg(QCoreApplication::applicationPid());
    QString sessionPath = dir.absoluteFilePath(sessionName);

    if (!dir.mkpath(sessionName)) {
        qCritical() << "Failed to create session directory:" << sessionPath;
    }

    cleanupOldSessions();

    return sessionPath;
}

void LangMcpLogger::cleanupOldSessions() {
    QString appDir = QString("%1/%2").arg(m_config.baseLogDir).arg(m_config.appName);
    QDir dir(appDir);

    QStringList sessions = dir.entryList(QDir::Dirs | QDir::NoDotAndDotDot, QDir::Name);

    while (sessions.size() > m_config.maxSessions) {
        QString oldestSession = sessions.takeFirst();
        QDir oldDir(dir.absoluteFilePath(oldestSession));
        if (oldDir.removeRecursively()) {
            writeToConsole(LogLevel::Debug, m_defaultCategory,
                           QString("Removed old session: %1").arg(oldestSession));
        } else {
            writeToConsole(LogLevel::Warning, m_defaultCategory,
                           QString("Failed to remove old session: %1").arg(oldestSession));
        }
    }
}

void LangMcpLogger::openLogFiles() {
    for (const auto& logFile : m_config.logFiles) {
        QString filePath = QDir(m_sessionPath).absoluteFilePath(logFile.name);

        auto file = std::make_unique<QFile>(filePath);
        if (!file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            qCritical() << "Failed to open log file:" << filePath << file->errorString();
            continue;
        }

        auto stream = std::make_unique<QTextStream>(file.get());

        FileInfo info;
        info.file = std::move(file);
        info.stream = std::move(stream);
        info.jsonFormat = logFile.jsonFormat;

        m_files[logFile.category] = std::move(info);
    }
}

void LangMcpLogger::closeLogFiles() {
    QMutexLocker locker(&m_mutex);

    for (auto& [category, info] : m_files) {
        if (info.stream) {
            info.stream->flush();
        }
        if (info.file) {
            info.file->close();
        }
    }
    m_files.clear();
}

QString LangMcpLogger::getLangMcpDataPath() {
    QString dataPath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return QDir(dataPath).absoluteFilePath("LangMcp");
}

QString LangMcpLogger::getBaseLogDir() {
    return QDir(getLangMcpDataPath()).absoluteFilePath("logs");
}

void LangMcpLogger::log(LogLevel level, const QString& category, const QString& message) {
    log(level, category, message, QJsonObject());
}

void LangMcpLogger::log(LogLevel level, const QString& category, const QString& message,
                        const QJsonObject& metadata) {
    if (level < m_config.minLevel) {
        return;
    }

    QMutexLocker locker(&m_mutex);

    const QString& effectiveCategory = category.isEmpty() ? m_defaultCategory : category;

    if (m_config.consoleEnabled) {
        writeToConsole(level, effectiveCategory, message);
    }

    writeToFile(effectiveCategory, level, message, metadata);
}

void LangMcpLogger::writeToFile(const QString& category, LogLevel level,
                                const QString& message, const QJsonObject& metadata) {
    auto it = m_files.find(category);
    if (it == m_files.end()) {
        it = m_files.find(m_defaultCategory);
        if (it == m_files.end()) {
            return;  // No file configured for this category
        }
    }

    auto& info = it->second;
    if (!info.stream) {
        return;
    }

    QString timestamp = QDateTime::currentDateTime().toString("yyyy-MM-dd HH:mm:ss.zzz");

    if (info.jsonFormat) {
        QJsonObject entry;
        entry["timestamp"] = timestamp;
        entry["level"] = levelToString(level);
        entry["category"] = category;
        entry["message"] = message;

        for (auto meta = metadata.begin(); meta != metadata.end(); ++meta) {
            entry[meta.key()] = meta.value();
        }

        *info.stream << QJsonDocument(entry).toJson(QJsonDocument::Compact) << Qt::endl;
    } else {
        *info.stream << timestamp << " [" << levelToString(level) << "] ";

        if (category != m_defaultCategory) {
            *info.stream << "[" << category << "] ";
        }

        *info.stream << message << Qt::endl;
    }

    if (level >= LogLevel::Warning) {
        info.stream->flush();
    }
}

void LangMcpLogger::writeToConsole(LogLevel level, const QString& category, const QString& message) {
    QString timestamp = QDateTime::currentDateTime().toString("HH:mm:ss.zzz");
    QString levelStr = levelToString(level);

    QTextStream out(stderr);

    if (m_config.consoleColors) {
        out << levelToColorCode(level) << timestamp << " [" << levelStr << "] ";
    } else {
        out << timestamp << " [" << levelStr << "] ";
    }

    if (category != m_defaultCategory) {
        out << "[" << category << "] ";
    }

    out << message;
    if (m_config.consoleColors) {
        out << "\033[0m";  // Reset color
    }
    out << Qt::endl;
}

QString LangMcpLogger::levelToString(LogLevel level) const {
    switch (level) {
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARN";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        default:                 return "UNKNOWN";
    }
}

QString LangMcpLogger::levelToColorCode(LogLevel level) const {
    switch (level) {
        case LogLevel::Debug:    return "\033[36m";  // Cyan
        case LogLevel::Info:     return "\033[32m";  // Green
        case LogLevel::Warning:  return "\033[33m";  // Yellow
        case LogLevel::Error:    return "\033[31m";  // Red
        case LogLevel::Critical: return "\033[35m";  // Magenta
        default:                 return "\033[0m";
    }
}

void LangMcpLogger::flush() {
    QMutexLocker locker(&m_mutex);

    for (auto& [category, info] : m_files) {
        if (info.stream) {
            info.stream->flush();
        }
    }
}

void LangMcpLogger::debug(const QString& message) {
    log(LogLevel::Debug, m_defaultCategory, message);
}

void LangMcpLogger::info(const QString& message) {
    log(LogLevel::Info, m_defaultCategory, message);
}

void LangMcpLogger::warning(const QString& message) {
    log(LogLevel::Warning, m_defaultCategory, message);
}

void LangMcpLogger::error(const QString& message) {
    log(LogLevel::Error, m_defaultCategory, message);
}

void LangMcpLogger::critical(const QString& message) {
    log(LogLevel::Critical, m_defaultCategory, message);
}
