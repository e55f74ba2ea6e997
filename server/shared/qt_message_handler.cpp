#include "qt_message_handler.h"
#include "langmcplogger.h"
#include <QString>

namespace LangMcpCommon {

static QtMessageHandler originalMessageHandler = nullptr;

static void unifiedMessageHandler(QtMsgType type, const QMessageLogContext &context, const QString &msg)
{
    // Console output is already handled by LangMcpLogger, so the original
    // handler only sees fatal messages (it aborts).
    if (type == QtFatalMsg && originalMessageHandler) {
        LangMcpLogger::instance().critical(QString("[Qt] %1").arg(msg));
        LangMcpLogger::instance().flush();
        originalMessageHandler(type, context, msg);
        return;
    }

    switch (type) {
    case QtDebugMsg:
        LangMcpLogger::instance().debug(QString("[Qt] %1").arg(msg));
        break;
    case QtInfoMsg:
        LangMcpLogger::instance().info(QString("[Qt] %1").arg(msg));
        break;
    case QtWarningMsg:
        LangMcpLogger::instance().warning(QString("[Qt] %1").arg(msg));
        break;
    case QtCriticalMsg:
    case QtFatalMsg:
        LangMcpLogger::instance().error(QString("[Qt] %1").arg(msg));
        break;
    }
}

void installQtMessageHandler()
{
    originalMessageHandler = qInstallMessageHandler(unifiedMessageHandler);
}

} // namespace LangMcpCommon
