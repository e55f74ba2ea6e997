#include "http_request.h"
#include <QUrl>

namespace LangMcp {

ParseStatus parseHttpRequest(QByteArray& buffer, HttpRequest& request)
{
    int headerEnd = buffer.indexOf("\r\n\r\n");
    if (headerEnd < 0) {
        return buffer.size() > kMaxHttpHeaderSize ? ParseStatus::TooLarge : ParseStatus::Incomplete;
    }

    const int headersLength = headerEnd + 4;
    QList<QByteArray> lines = buffer.left(headerEnd).split('\n');
    for (auto& line : lines) {
        if (line.endsWith('\r')) {
            line.chop(1);
        }
    }

    // METHOD SP request-target SP HTTP-version
    QList<QByteArray> requestLine = lines.takeFirst().split(' ');
    if (requestLine.size() != 3 || requestLine[0].isEmpty() || !requestLine[1].startsWith('/') ||
        !requestLine[2].startsWith("HTTP/1.")) {
        return ParseStatus::Malformed;
    }

    HttpRequest parsed;
    parsed.method = QString::fromLatin1(requestLine[0]).toUpper();

    QUrl target(QString::fromUtf8(requestLine[1]));
    if (!target.isValid()) {
        return ParseStatus::Malformed;
    }
    parsed.path = target.path();
    parsed.query = QUrlQuery(target);

    for (const auto& line : lines) {
        int colon = line.indexOf(':');
        if (colon <= 0) {
            return ParseStatus::Malformed;
        }
        parsed.headers.insert(line.left(colon).trimmed().toLower(), line.mid(colon + 1).trimmed());
    }

    qint64 contentLength = 0;
    if (parsed.headers.contains("content-length")) {
        bool ok = false;
        contentLength = parsed.headers.value("content-length").toLongLong(&ok);
        if (!ok || contentLength < 0) {
            return ParseStatus::Malformed;
        }
    }

    if (contentLength > kMaxHttpBodySize) {
        return ParseStatus::TooLarge;
    }

    if (buffer.size() < headersLength + contentLength) {
        return ParseStatus::Incomplete;
    }

    parsed.body = buffer.mid(headersLength, static_cast<int>(contentLength));
    buffer.remove(0, headersLength + static_cast<int>(contentLength));

    request = parsed;
    return ParseStatus::Complete;
}

const char* httpStatusText(int statusCode)
{
    switch (statusCode) {
        case 200: return "OK";
        case 202: return "Accepted";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default:  return "Unknown";
    }
}

QByteArray buildHttpResponse(int statusCode, const QByteArray& contentType, const QByteArray& body,
                             const QMap<QByteArray, QByteArray>& extraHeaders)
{
    QByteArray response;
    response.append("HTTP/1.1 ").append(QByteArray::number(statusCode)).append(' ')
            .append(httpStatusText(statusCode)).append("\r\n");
    if (!contentType.isEmpty()) {
        response.append("Content-Type: ").append(contentType).append("\r\n");
    }
    response.append("Content-Length: ").append(QByteArray::number(body.size())).append("\r\n");
    response.append("Access-Control-Allow-Origin: *\r\n");
    for (auto it = extraHeaders.constBegin(); it != extraHeaders.constEnd(); ++it) {
        response.append(it.key()).append(": ").append(it.value()).append("\r\n");
    }
    response.append("Connection: close\r\n");
    response.append("\r\n");
    response.append(body);
    return response;
}

} // namespace LangMcp
