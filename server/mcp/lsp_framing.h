#ifndef LSP_FRAMING_H
#define LSP_FRAMING_H

#include <QByteArray>
#include <QJsonObject>
#include <QString>

namespace LangMcp {

enum class FrameStatus {
    Incomplete,
    Complete,
    Malformed
};

// Content-Length framed JSON-RPC, as spoken over a language server's stdio
QByteArray encodeLspMessage(const QJsonObject& message);

/**
 * Take one message off the front of buffer. Complete and Malformed both
 * consume the frame so the stream can resynchronise on the next header.
 */
FrameStatus decodeLspMessage(QByteArray& buffer, QJsonObject& message, QString* error = nullptr);

} // namespace LangMcp

#endif // LSP_FRAMING_H
