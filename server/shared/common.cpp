#include "common.h"
#include "langmcplogger.h"
#include <QTcpServer>
#include <QMetaObject>
#include <QSocketNotifier>
#include <QCoreApplication>
#include <iostream>
#include <csignal>
#ifndef Q_OS_WIN
#include <unistd.h>
#include <errno.h>
#include <fcntl.h>
#include <cstring>
#else
#include <windows.h>
#endif

namespace LangMcpCommon {

std::unique_ptr<QTcpServer> bindListener(quint16 preferredPort, quint16& outPort,
                                         bool& usedFallback, const QHostAddress& address,
                                         QString* errorString) {
    auto server = std::make_unique<QTcpServer>();
    usedFallback = false;

    if (server->listen(address, preferredPort)) {
        outPort = server->serverPort();
        return server;
    }

    QString preferredError = server->errorString();

    // Port 0 already means "any port", nothing to fall back to
    if (preferredPort != 0 && server->listen(address, 0)) {
        outPort = server->serverPort();
        usedFallback = true;
        if (LangMcpLogger::isInitialized()) {
            LangMcpLogger::instance().warning(
                QString("Port %1 unavailable (%2), using OS-assigned port %3")
                .arg(preferredPort).arg(preferredError).arg(outPort));
        }
        return server;
    }

    if (errorString) {
        *errorString = server->errorString();
    }
    outPort = 0;
    return nullptr;
}

bool isPortAvailable(quint16 port, const QHostAddress& address) {
    QTcpServer testServer;
    bool available = testServer.listen(address, port);
    testServer.close();
    return available;
}

static volatile std::sig_atomic_t g_signalReceived = 0;

#ifndef Q_OS_WIN
static int signalPipeFd[2] = {-1, -1};
static QSocketNotifier* signalNotifier = nullptr;

static void signalHandler(int signal) {
    g_signalReceived = signal;
    char a = 1;
    if (signalPipeFd[1] != -1) {
        ssize_t result = ::write(signalPipeFd[1], &a, sizeof(a));
        (void)result;
    }
}
#else
static BOOL WINAPI consoleCtrlHandler(DWORD dwCtrlType) {
    switch (dwCtrlType) {
        case CTRL_C_EVENT:
        case CTRL_BREAK_EVENT:
        case CTRL_CLOSE_EVENT:
        case CTRL_LOGOFF_EVENT:
        case CTRL_SHUTDOWN_EVENT:
            g_signalReceived = SIGINT;
            if (qApp) {
                QMetaObject::invokeMethod(qApp, "quit", Qt::QueuedConnection);
            }
            return TRUE;
    }
    return FALSE;
}

static void signalHandler(int signal) {
    g_signalReceived = signal;
}
#endif

void setupSignalHandlers() {
#ifndef Q_OS_WIN
    if (::pipe(signalPipeFd) == -1) {
        std::cerr << "Failed to create signal pipe: " << strerror(errno) << std::endl;
        return;
    }

    auto set_nb_cloexec = [](int fd) {
        int flags = ::fcntl(fd, F_GETFL);
        if (flags != -1) {
            ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
        }
        int fdflags = ::fcntl(fd, F_GETFD);
        if (fdflags != -1) {
            ::fcntl(fd, F_SETFD, fdflags | FD_CLOEXEC);
        }
    };

    set_nb_cloexec(signalPipeFd[0]);
    set_nb_cloexec(signalPipeFd[1]);

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    std::signal(SIGHUP, signalHandler);
    // A client vanishing mid-write must not kill the server
    std::signal(SIGPIPE, SIG_IGN);
#else
    SetConsoleCtrlHandler(consoleCtrlHandler, TRUE);
    std::signal(SIGTERM, signalHandler);
#endif
}

void setupSignalNotifier() {
#ifndef Q_OS_WIN
    if (!qApp) {
        std::cerr << "setupSignalNotifier called before QCoreApplication creation!" << std::endl;
        return;
    }

    if (signalPipeFd[0] == -1) {
        std::cerr << "setupSignalNotifier called before setupSignalHandlers!" << std::endl;
        return;
    }

    signalNotifier = new QSocketNotifier(signalPipeFd[0], QSocketNotifier::Read, qApp);
    QObject::connect(signalNotifier, &QSocketNotifier::activated, [](QSocketDescriptor, QSocketNotifier::Type) {
        char tmp;
        while (::read(signalPipeFd[0], &tmp, sizeof(tmp)) > 0) {}

        if (g_signalReceived != 0 && qApp) {
            qApp->quit();
        }
    });
#endif
}

bool isTerminationRequested() {
    return g_signalReceived != 0;
}

void cleanupSignalHandlers() {
#ifndef Q_OS_WIN
    if (signalNotifier) {
        delete signalNotifier;
        signalNotifier = nullptr;
    }

    if (signalPipeFd[0] != -1) {
        ::close(signalPipeFd[0]);
        signalPipeFd[0] = -1;
    }

    if (signalPipeFd[1] != -1) {
        ::close(signalPipeFd[1]);
        signalPipeFd[1] = -1;
    }
#endif
}

} // namespace LangMcpCommon
