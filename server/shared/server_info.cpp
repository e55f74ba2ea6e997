#include "server_info.h"
#include <QTextStream>

namespace LangMcpCommon {

QString sseEndpointUrl(quint16 port) {
    return QString("http://localhost:%1/sse").arg(port);
}

QString messageEndpointUrl(quint16 port) {
    return QString("http://localhost:%1/message").arg(port);
}

QString healthEndpointUrl(quint16 port) {
    return QString("http://localhost:%1/health").arg(port);
}

QString generateServerInfoString(const ServerInfo& info, bool verbose) {
    QString result;
    QTextStream stream(&result);

    stream << "\n";
    stream << "========================================================\n";
    stream << "LangMcp Server Started\n";
    stream << "--------------------------------------------------------\n";

    stream << "  SSE:       " << sseEndpointUrl(info.port) << "\n";
    stream << "  Messages:  " << messageEndpointUrl(info.port) << "\n";
    stream << "  Health:    " << healthEndpointUrl(info.port) << "\n";

    stream << "  Port:      " << info.port;
    if (info.usedFallbackPort) {
        stream << " (preferred port " << info.preferredPort << " was unavailable)";
    }
    stream << "\n";

    if (info.allowRemote) {
        stream << "  Listening: all interfaces\n";
    }

    stream << "  LSP:       " << info.lspCommand << "\n";
    stream << "  Workspace: " << info.workspacePath << "\n";

    if (verbose) {
        stream << "  Timeout:   ";
        if (info.providerTimeoutMs > 0) {
            stream << info.providerTimeoutMs << " ms per lookup\n";
        } else {
            stream << "none\n";
        }
        stream << "  PID:       " << info.pid << "\n";
    }

    stream << "  Logs:      " << info.logPath << "\n";
    stream << "========================================================\n";
    stream << "Press Ctrl+C to stop\n";

    stream.flush();
    return result;
}

} // namespace LangMcpCommon
