#include "document_preview.h"
#include <QUrl>
#include <QFile>
#include <QTextStream>

namespace LangMcp {

PreviewResult readLinePreview(const QString& uri, int line)
{
    if (line < 0) {
        return PreviewResult::failure(QString("Negative line %1").arg(line));
    }

    QUrl url(QUrl::fromPercentEncoding(uri.toUtf8()));
    if (!url.isLocalFile()) {
        return PreviewResult::failure(QString("Not a local file: %1").arg(uri));
    }

    QFile file(url.toLocalFile());
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return PreviewResult::failure(QString("Cannot open %1: %2").arg(file.fileName(), file.errorString()));
    }

    QTextStream in(&file);
    int current = 0;
    while (!in.atEnd()) {
        QString text = in.readLine();
        if (current == line) {
            return PreviewResult::success(text.trimmed());
        }
        current++;
    }

    return PreviewResult::failure(QString("Line %1 is past the end of %2 (%3 lines)")
        .arg(line).arg(file.fileName()).arg(current));
}

} // namespace LangMcp
