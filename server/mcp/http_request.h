#ifndef HTTP_REQUEST_H
#define HTTP_REQUEST_H

#include <QByteArray>
#include <QString>
#include <QMap>
#include <QUrlQuery>

namespace LangMcp {

constexpr qint64 kMaxHttpBodySize = 4 * 1024 * 1024;
constexpr int kMaxHttpHeaderSize = 64 * 1024;

struct HttpRequest {
    QString method;
    QString path;
    QUrlQuery query;
    QMap<QByteArray, QByteArray> headers;   // Names lower-cased
    QByteArray body;

    QByteArray header(const QByteArray& name) const { return headers.value(name.toLower()); }
};

enum class ParseStatus {
    Incomplete,     // Need more bytes
    Complete,       // One request parsed and removed from the buffer
    Malformed,      // Bad request line or header
    TooLarge        // Headers or declared body over the limit
};

/**
 * Parse one HTTP/1.x request from the front of buffer. On Complete the
 * consumed bytes are removed so pipelined data stays in place.
 */
ParseStatus parseHttpRequest(QByteArray& buffer, HttpRequest& request);

const char* httpStatusText(int statusCode);

// A complete response with CORS and Connection: close headers
QByteArray buildHttpResponse(int statusCode, const QByteArray& contentType, const QByteArray& body,
                             const QMap<QByteArray, QByteArray>& extraHeaders = {});

} // namespace LangMcp

#endif // HTTP_REQUEST_H
