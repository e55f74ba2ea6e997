#include <iostream>
#include <memory>
#include <QCoreApplication>
#include <QDir>
#include <QObject>
#include "shared/langmcplogger.h"
#include "shared/common.h"
#include "shared/cli_args.h"
#include "shared/cli_help.h"
#include "shared/health_check.h"
#include "shared/qt_message_handler.h"
#include "shared/server_info.h"
#include "mcp/lsp_reference_provider.h"
#include "mcp/server_lifecycle.h"

using namespace LangMcpCommon;

static ExitCode exitCodeFor(LangMcp::LifecycleError error) {
    switch (error) {
        case LangMcp::LifecycleError::AlreadyRunning: return ExitCode::MCP_SERVER_ALREADY_RUNNING;
        case LangMcp::LifecycleError::BindFailed:     return ExitCode::PORT_ALLOCATION_FAILED;
        default:                                      return ExitCode::MCP_SERVER_FAILED;
    }
}

int main(int argc, char *argv[]) {
    LangMcpCLI::CommonArgs args;

    // Environment first so explicit flags win
    LangMcpCLI::applyEnvironmentOverrides(args);
    if (args.hasError) {
        std::cerr << "Error: " << args.errorMessage << "\n";
        return static_cast<int>(ExitCode::CONFIGURATION_ERROR);
    }

    for (int i = 1; i < argc; ++i) {
        const char* nextArg = (i + 1 < argc) ? argv[i + 1] : nullptr;

        if (LangMcpCLI::parseSharedArg(argv[i], nextArg, i, args)) {
            if (args.hasError) {
                std::cerr << "Error: " << args.errorMessage << "\n";
                std::cout << LangMcpCLI::generateHelpText(argv[0]);
                return static_cast<int>(ExitCode::INVALID_ARGUMENTS);
            }
            if (args.showHelp) {
                std::cout << LangMcpCLI::generateHelpText(argv[0]);
                return 0;
            }
            if (args.showVersion) {
                std::cout << LangMcpCLI::generateVersionString() << "\n";
                return 0;
            }
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            std::cout << LangMcpCLI::generateHelpText(argv[0]);
            return static_cast<int>(ExitCode::INVALID_ARGUMENTS);
        }
    }

    if (!LangMcpCLI::validateArguments(args)) {
        std::cerr << "Error: " << args.errorMessage << "\n";
        return static_cast<int>(args.errorMessage.find("--workspace") == 0
            ? ExitCode::WORKSPACE_NOT_FOUND
            : ExitCode::INVALID_ARGUMENTS);
    }

    LangMcpCLI::ServerConfig serverConfig(args);

    if (args.dryRun) {
        LangMcpCLI::printDryRunConfig(serverConfig);
        return 0;
    }

    setupSignalHandlers();

    QCoreApplication app(argc, argv);
    app.setApplicationName(Config::APP_NAME);
    app.setApplicationVersion(Config::APP_VERSION);

    if (args.check) {
        LangMcpLoggerConfig logConfig;
        logConfig.appName = "server";
        logConfig.logFiles = {
            {"server.log", "server", false}
        };
        logConfig.consoleEnabled = true;
        logConfig.consoleColors = true;
        logConfig.baseLogDir = LangMcpLogger::getBaseLogDir();
        LangMcpLogger::initialize(logConfig);

        LangMcpHealthCheck::HealthCheckConfig checkConfig;
        checkConfig.binaryName = "langmcp-server";
        checkConfig.verbose = args.verbose;
        checkConfig.strictMode = false;
        checkConfig.runTests = args.verbose;  // Run tests in verbose mode
        checkConfig.testPort = args.port;
        checkConfig.serverConfig = &serverConfig;

        int result = LangMcpHealthCheck::runHealthCheck(checkConfig);
        cleanupSignalHandlers();
        return result;
    }

    setupSignalNotifier();

    LangMcpLoggerConfig logConfig;
    logConfig.appName = "server";
    logConfig.logFiles = {
        {"server.log", "server", false},
        {"mcp.log", "mcp", true},
        {"lsp.log", "lsp", false}
    };
    logConfig.consoleEnabled = args.verbose;
    logConfig.consoleColors = true;
    logConfig.baseLogDir = LangMcpLogger::getBaseLogDir();
    LangMcpLogger::initialize(logConfig);

    installQtMessageHandler();

    LangMcpLogger::instance().info(QString("Starting %1 %2")
        .arg(QString::fromLatin1(Config::APP_NAME), QString::fromLatin1(Config::APP_VERSION)));

    LangMcp::LspServerConfig lspConfig;
    lspConfig.command = serverConfig.getLspCommand();
    lspConfig.arguments = serverConfig.getLspArguments();
    lspConfig.workspacePath = serverConfig.getWorkspacePath();
    lspConfig.rootUri = serverConfig.getWorkspaceUri();
    lspConfig.lookupTimeoutMs = serverConfig.getProviderTimeoutMs();

    auto provider = std::make_shared<LangMcp::LspReferenceProvider>(lspConfig);
    auto lifecycle = std::make_unique<LangMcp::ServerLifecycle>(provider);

    LangMcp::StartResult started = lifecycle->start(serverConfig.getPreferredPort(), serverConfig.getBindAddress());
    if (!started.ok()) {
        LANGMCP_LOG_ERROR(QString("Server start failed (%1): %2")
            .arg(QString::fromLatin1(LangMcp::lifecycleErrorToString(started.error)), started.message));
        return reportExit(exitCodeFor(started.error), started.message);
    }

    ServerInfo serverInfo;
    serverInfo.preferredPort = serverConfig.getPreferredPort();
    serverInfo.port = started.port;
    serverInfo.usedFallbackPort = started.usedFallbackPort;
    serverInfo.allowRemote = args.allowRemote;
    serverInfo.pid = QCoreApplication::applicationPid();
    serverInfo.logPath = LangMcpLogger::instance().currentSessionPath();
    serverInfo.lspCommand = QString("%1 %2").arg(lspConfig.command, lspConfig.arguments.join(' ')).trimmed();
    serverInfo.workspacePath = lspConfig.workspacePath;
    serverInfo.providerTimeoutMs = lspConfig.lookupTimeoutMs;

    QString infoString = generateServerInfoString(serverInfo, args.verbose);
    if (args.verbose) {
        LangMcpLogger::instance().info(infoString);
    } else {
        std::cout << infoString.toStdString() << "\n" << std::flush;
    }

    // The front door goes before the language server so no lookup starts mid-teardown
    QObject::connect(&app, &QCoreApplication::aboutToQuit, [&lifecycle, &provider, &args]() {
        if (!args.verbose) {
            std::cout << "\nShutting down... " << std::flush;
        }
        LANGMCP_LOG_INFO("Shutting down");

        lifecycle->stop();
        provider->shutdown();
        cleanupSignalHandlers();

        if (!args.verbose) {
            std::cout << "done\n" << std::flush;
        }
        LANGMCP_LOG_INFO("Server stopped");
    });

    int result = app.exec();

    lifecycle.reset();
    provider.reset();
    LangMcpLogger::instance().flush();

    return result;
}
