#ifndef SERVER_INFO_H
#define SERVER_INFO_H

#include <QString>
#include <QtGlobal>
#include "common.h"

namespace LangMcpCommon {

/**
 * Runtime state shown to the operator once the server is listening
 */
struct ServerInfo {
    quint16 preferredPort = 0;
    quint16 port = 0;
    bool usedFallbackPort = false;
    bool allowRemote = false;
    qint64 pid = 0;
    QString logPath;
    QString lspCommand;
    QString workspacePath;
    int providerTimeoutMs = 0;
};

/**
 * Generate the startup banner as a formatted string
 * @param info Server information structure with runtime state
 * @param verbose If true, includes additional details for verbose mode
 * @return Formatted string ready to be printed with a single cout/logger call
 */
QString generateServerInfoString(const ServerInfo& info, bool verbose = false);

/**
 * URLs of the three HTTP endpoints for a given port
 */
QString sseEndpointUrl(quint16 port);
QString messageEndpointUrl(quint16 port);
QString healthEndpointUrl(quint16 port);

} // namespace LangMcpCommon

#endif // SERVER_INFO_H
