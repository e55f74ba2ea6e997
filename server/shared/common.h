#ifndef COMMON_H
#define COMMON_H

#include <QString>
#include <QCoreApplication>
#include <QTcpServer>
#include <QHostAddress>
#include <memory>
#include "error_codes.h"

namespace LangMcpCommon {

    namespace Config {
        constexpr const char* APP_NAME = "langmcp";

        #ifdef LANGMCP_VERSION
            constexpr const char* APP_VERSION = LANGMCP_VERSION;
        #else
            constexpr const char* APP_VERSION = "0.0.0";
        #endif

        #ifdef LANGMCP_COMMIT
            constexpr const char* APP_COMMIT = LANGMCP_COMMIT;
        #else
            constexpr const char* APP_COMMIT = "unknown";
        #endif

        // Advertised to MCP clients in the initialize handshake
        constexpr const char* MCP_SERVER_NAME = "language-tools";
        constexpr const char* MCP_SERVER_VERSION = "0.1.0";

        constexpr quint16 DEFAULT_PORT = 8008;
        constexpr const char* DEFAULT_LSP_COMMAND = "clangd";
        constexpr int DEFAULT_PROVIDER_TIMEOUT_MS = 30000;
    }

    // Bind a listening socket, preferring the given port and falling back to an
    // OS-assigned one when it is taken. The returned server keeps holding the port.
    // Returns nullptr (outPort = 0) when no port could be bound at all.
    std::unique_ptr<QTcpServer> bindListener(quint16 preferredPort, quint16& outPort,
                                             bool& usedFallback,
                                             const QHostAddress& address = QHostAddress::LocalHost,
                                             QString* errorString = nullptr);

    bool isPortAvailable(quint16 port, const QHostAddress& address = QHostAddress::LocalHost);

    // Setup console signal handling for graceful shutdown
    void setupSignalHandlers();

    // Setup Qt-dependent signal handling components (must be called after QCoreApplication creation)
    void setupSignalNotifier();

    // Check if a termination signal has been received
    bool isTerminationRequested();

    // Cleanup signal handling resources
    void cleanupSignalHandlers();
}

#endif // COMMON_H
