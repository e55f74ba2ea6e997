#include "lsp_framing.h"
#include <QJsonDocument>
#include <QList>

namespace LangMcp {

QByteArray encodeLspMessage(const QJsonObject& message)
{
    QByteArray json = QJsonDocument(message).toJson(QJsonDocument::Compact);
    QByteArray frame = "Content-Length: " + QByteArray::number(json.size()) + "\r\n\r\n";
    frame.append(json);
    return frame;
}

FrameStatus decodeLspMessage(QByteArray& buffer, QJsonObject& message, QString* error)
{
    int headerEnd = buffer.indexOf("\r\n\r\n");
    if (headerEnd < 0) {
        return FrameStatus::Incomplete;
    }

    qint64 contentLength = -1;
    const QList<QByteArray> headers = buffer.left(headerEnd).split('\n');
    for (const auto& rawLine : headers) {
        QByteArray line = rawLine.trimmed();
        int colon = line.indexOf(':');
        if (colon <= 0) {
            continue;
        }
        if (line.left(colon).trimmed().toLower() == "content-length") {
            bool ok = false;
            contentLength = line.mid(colon + 1).trimmed().toLongLong(&ok);
            if (!ok) {
                contentLength = -1;
            }
        }
    }

    const int bodyStart = headerEnd + 4;
    if (contentLength < 0) {
        buffer.remove(0, bodyStart);
        if (error) {
            *error = "Missing or invalid Content-Length header";
        }
        return FrameStatus::Malformed;
    }

    if (buffer.size() < bodyStart + contentLength) {
        return FrameStatus::Incomplete;
    }

    QByteArray body = buffer.mid(bodyStart, static_cast<int>(contentLength));
    buffer.remove(0, bodyStart + static_cast<int>(contentLength));

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (error) {
            *error = parseError.error != QJsonParseError::NoError
                ? parseError.errorString()
                : QString("Message is not a JSON object");
        }
        return FrameStatus::Malformed;
    }

    message = doc.object();
    return FrameStatus::Complete;
}

} // namespace LangMcp
