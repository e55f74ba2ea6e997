#ifndef QT_MESSAGE_HANDLER_H
#define QT_MESSAGE_HANDLER_H

#include <QtGlobal>

namespace LangMcpCommon {
    /**
     * Install the Qt message handler that routes qDebug/qInfo/qWarning/qCritical
     * output through LangMcpLogger with a [Qt] prefix.
     * Must be called after LangMcpLogger::initialize().
     */
    void installQtMessageHandler();
}

#endif // QT_MESSAGE_HANDLER_H
