#ifndef LANGMCPLOGGER_H
#define LANGMCPLOGGER_H

#include <QObject>
#include <QString>
#include <QJsonObject>
#include <QVector>
#include <QMutex>
#include <QFile>
#include <QTextStream>
#include <memory>
#include <unordered_map>

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3,
    Critical = 4
};

struct LangMcpLoggerConfig {
    QString appName;                    // Required: "server" or "tests"
    QString baseLogDir;                 // Default: ~/.local/share/LangMcp/logs
    int maxSessions = 5;                // Keep last 5 session folders

    struct LogFile {
        QString name;                   // e.g., "server.log", "mcp.log"
        QString category;               // Category that maps to this file
        bool jsonFormat = false;        // Plain text or JSONL
    };
    QVector<LogFile> logFiles;          // Multiple logs per session

    bool consoleEnabled = true;
    bool consoleColors = true;
    LogLevel minLevel = LogLevel::Debug;
};

class LangMcpLogger : public QObject {
    Q_OBJECT

public:
    // Simple initialization - just app name, defaults for everything else
    static void initialize(const QString& appName);

    // Full configuration
    static void initialize(const LangMcpLoggerConfig& config);

    static LangMcpLogger& instance();
    static bool isInitialized();

    // Logging methods with category
    void log(LogLevel level, const QString& category, const QString& message);
    void log(LogLevel level, const QString& category, const QString& message,
             const QJsonObject& metadata);

    // Convenience methods that use default category (first configured file)
    void debug(const QString& message);
    void info(const QString& message);
    void warning(const QString& message);
    void error(const QString& message);
    void critical(const QString& message);

    QString currentSessionPath() const { return m_sessionPath; }

    void flush();

    static QString getLangMcpDataPath();
    static QString getBaseLogDir();

public:
    LangMcpLogger();
    ~LangMcpLogger();

private:
    void initializeWithConfig(const LangMcpLoggerConfig& config);
    QString createSessionFolder();
    void cleanupOldSessions();
    void openLogFiles();
    void closeLogFiles();
    void writeToFile(const QString& category, LogLevel level,
                     const QString& message, const QJsonObject& metadata);
    void writeToConsole(LogLevel level, const QString& category, const QString& message);
    QString levelToString(LogLevel level) const;
    QString levelToColorCode(LogLevel level) const;

    LangMcpLoggerConfig m_config;
    QString m_sessionPath;
    QString m_defaultCategory;
    mutable QMutex m_mutex;

    struct FileInfo {
        std::unique_ptr<QFile> file;
        std::unique_ptr<QTextStream> stream;
        bool jsonFormat;
    };
    std::unordered_map<QString, FileInfo> m_files;

    static std::unique_ptr<LangMcpLogger> s_instance;
    static QMutex s_instanceMutex;
};

#define LANGMCP_LOG_DEBUG(msg) LangMcpLogger::instance().debug(msg)
#define LANGMCP_LOG_INFO(msg) LangMcpLogger::instance().info(msg)
#define LANGMCP_LOG_WARNING(msg) LangMcpLogger::instance().warning(msg)
#define LANGMCP_LOG_ERROR(msg) LangMcpLogger::instance().error(msg)
#define LANGMCP_LOG_CRITICAL(msg) LangMcpLogger::instance().critical(msg)

#endif // LANGMCPLOGGER_H
