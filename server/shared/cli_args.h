#ifndef LANGMCP_CLI_ARGS_H
#define LANGMCP_CLI_ARGS_H

#include <cstring>
#include <string>
#include <vector>
#include <cstdlib>
#include <sstream>
#include <iostream>
#include <QtCore/QtGlobal>
#include <QtCore/QDir>
#include <QtCore/QFileInfo>
#include <QtCore/QUrl>
#include <QtCore/QStringList>
#include "common.h"

namespace LangMcpCLI {

struct CommonArgs {
    // Network
    quint16 port = LangMcpCommon::Config::DEFAULT_PORT;  // Preferred port (0 = OS-assigned)
    bool allowRemote = false;      // Bind all interfaces instead of loopback

    // Capability provider (language server)
    std::string lspCommand = LangMcpCommon::Config::DEFAULT_LSP_COMMAND;
    std::vector<std::string> lspArgs;
    std::string workspace;         // Empty = current directory
    int providerTimeoutMs = LangMcpCommon::Config::DEFAULT_PROVIDER_TIMEOUT_MS;  // 0 = no timeout

    // Other
    bool verbose = false;
    bool check = false;            // Verify installation
    bool dryRun = false;           // Show configuration without starting
    bool showHelp = false;
    bool showVersion = false;

    // Error handling
    bool hasError = false;
    std::string errorMessage;
};

// Immutable server configuration generated from CommonArgs
class ServerConfig {
public:
    explicit ServerConfig(const CommonArgs& args)
        : m_args(args) {
        QString workspace = args.workspace.empty()
            ? QDir::currentPath()
            : QString::fromStdString(args.workspace);
        m_workspacePath = QDir(workspace).absolutePath();
        m_workspaceUri = QUrl::fromLocalFile(m_workspacePath).toString();
    }

    const CommonArgs& getArgs() const { return m_args; }
    quint16 getPreferredPort() const { return m_args.port; }
    QHostAddress getBindAddress() const {
        return m_args.allowRemote ? QHostAddress(QHostAddress::Any) : QHostAddress(QHostAddress::LocalHost);
    }
    QString getWorkspacePath() const { return m_workspacePath; }
    QString getWorkspaceUri() const { return m_workspaceUri; }
    QString getLspCommand() const { return QString::fromStdString(m_args.lspCommand); }
    QStringList getLspArguments() const {
        QStringList list;
        for (const auto& arg : m_args.lspArgs) {
            list << QString::fromStdString(arg);
        }
        return list;
    }
    int getProviderTimeoutMs() const { return m_args.providerTimeoutMs; }

private:
    CommonArgs m_args;
    QString m_workspacePath;
    QString m_workspaceUri;
};

// Returns true if there was an error, false if successful
inline bool parsePortValue(const char* value, quint16& portValue, CommonArgs& args, const char* argName) {
    if (value == nullptr) {
        args.hasError = true;
        args.errorMessage = std::string(argName) + " requires a port number";
        return true;
    }
    char* endPtr;
    long port = std::strtol(value, &endPtr, 10);
    if (*endPtr != '\0' || endPtr == value) {
        args.hasError = true;
        args.errorMessage = std::string(argName) + " must be a valid number";
        return true;
    }
    if (port < 0 || port > 65535) {
        args.hasError = true;
        args.errorMessage = std::string(argName) + " must be between 0 and 65535";
        return true;
    }
    portValue = static_cast<quint16>(port);
    return false;
}

inline bool parseTimeoutValue(const char* value, int& timeoutMs, CommonArgs& args, const char* argName) {
    if (value == nullptr) {
        args.hasError = true;
        args.errorMessage = std::string(argName) + " requires a number of milliseconds";
        return true;
    }
    char* endPtr;
    long timeout = std::strtol(value, &endPtr, 10);
    if (*endPtr != '\0' || endPtr == value || timeout < 0 || timeout > 3600000) {
        args.hasError = true;
        args.errorMessage = std::string(argName) + " must be between 0 and 3600000";
        return true;
    }
    timeoutMs = static_cast<int>(timeout);
    return false;
}

// Parse one command-line argument
// Returns true if the argument was recognized (whether successful or not)
// Check args.hasError to see if there was an error processing the argument
inline bool parseSharedArg(const char* arg, const char* nextArg, int& i, CommonArgs& args) {
    if (std::strcmp(arg, "--port") == 0) {
        if (!parsePortValue(nextArg, args.port, args, "--port")) {
            i++;
        }
        return true;
    } else if (std::strcmp(arg, "--allow-remote") == 0) {
        args.allowRemote = true;
        return true;
    } else if (std::strcmp(arg, "--lsp-command") == 0) {
        if (nextArg != nullptr) {
            args.lspCommand = nextArg;
            i++;
        } else {
            args.hasError = true;
            args.errorMessage = "--lsp-command requires an executable";
        }
        return true;
    } else if (std::strcmp(arg, "--lsp-arg") == 0) {
        if (nextArg != nullptr) {
            args.lspArgs.push_back(nextArg);
            i++;
        } else {
            args.hasError = true;
            args.errorMessage = "--lsp-arg requires a value";
        }
        return true;
    } else if (std::strcmp(arg, "--workspace") == 0) {
        if (nextArg != nullptr) {
            args.workspace = nextArg;
            i++;
        } else {
            args.hasError = true;
            args.errorMessage = "--workspace requires a path";
        }
        return true;
    } else if (std::strcmp(arg, "--provider-timeout") == 0) {
        if (!parseTimeoutValue(nextArg, args.providerTimeoutMs, args, "--provider-timeout")) {
            i++;
        }
        return true;
    } else if (std::strcmp(arg, "--verbose") == 0) {
        args.verbose = true;
        return true;
    } else if (std::strcmp(arg, "--check") == 0) {
        args.check = true;
        return true;
    } else if (std::strcmp(arg, "--dry-run") == 0) {
        args.dryRun = true;
        return true;
    } else if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
        args.showHelp = true;
        return true;
    } else if (std::strcmp(arg, "--version") == 0) {
        args.showVersion = true;
        return true;
    }

    return false;
}

// Apply LANGMCP_* environment variables. Call before parsing the command line
// so explicit flags override the environment.
inline void applyEnvironmentOverrides(CommonArgs& args) {
    QByteArray port = qgetenv("LANGMCP_PORT");
    if (!port.isEmpty() && parsePortValue(port.constData(), args.port, args, "LANGMCP_PORT")) {
        return;
    }

    QByteArray lspCommand = qgetenv("LANGMCP_LSP_COMMAND");
    if (!lspCommand.isEmpty()) {
        args.lspCommand = lspCommand.toStdString();
    }

    QByteArray workspace = qgetenv("LANGMCP_WORKSPACE");
    if (!workspace.isEmpty()) {
        args.workspace = workspace.toStdString();
    }

    QByteArray timeout = qgetenv("LANGMCP_PROVIDER_TIMEOUT_MS");
    if (!timeout.isEmpty()) {
        parseTimeoutValue(timeout.constData(), args.providerTimeoutMs, args, "LANGMCP_PROVIDER_TIMEOUT_MS");
    }
}

// Validate arguments for conflicts and dependencies
inline bool validateArguments(CommonArgs& args) {
    if (args.hasError) {
        return false;
    }

    if (args.lspCommand.empty()) {
        args.hasError = true;
        args.errorMessage = "--lsp-command must not be empty";
        return false;
    }

    if (!args.workspace.empty()) {
        QFileInfo info(QString::fromStdString(args.workspace));
        if (!info.exists() || !info.isDir()) {
            args.hasError = true;
            args.errorMessage = "--workspace must name an existing directory: " + args.workspace;
            return false;
        }
    }

    return true;
}

inline std::string generateDryRunConfig(const ServerConfig& config) {
    const CommonArgs& args = config.getArgs();
    std::ostringstream oss;
    oss << "\n========================================\n";
    oss << "LangMcp Configuration (--dry-run)\n";
    oss << "========================================\n\n";

    oss << "Network:\n";
    oss << "  Preferred Port: " << (args.port > 0 ? std::to_string(args.port) : "OS-assigned") << "\n";
    oss << "  Bind Address: " << (args.allowRemote ? "all interfaces" : "127.0.0.1") << "\n";
    oss << "\n";

    oss << "Language Server:\n";
    oss << "  Command: " << args.lspCommand;
    for (const auto& extra : args.lspArgs) {
        oss << " " << extra;
    }
    oss << "\n";
    oss << "  Workspace: " << config.getWorkspacePath().toStdString() << "\n";
    oss << "  Lookup Timeout: ";
    if (args.providerTimeoutMs > 0) {
        oss << args.providerTimeoutMs << " ms\n";
    } else {
        oss << "none\n";
    }
    oss << "\n";

    oss << "Other:\n";
    oss << "  Verbose Logging: " << (args.verbose ? "Yes" : "No") << "\n";
    oss << "\n========================================\n\n";

    return oss.str();
}

inline void printDryRunConfig(const ServerConfig& config) {
    std::cout << generateDryRunConfig(config);
}

} // namespace LangMcpCLI

#endif // LANGMCP_CLI_ARGS_H
