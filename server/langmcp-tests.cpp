#include <QCoreApplication>
#include <QList>
#include "shared/langmcplogger.h"
#include "shared/common.h"
#include "shared/test_cli_args.h"
#include "mcp/mcp_tests.h"

using namespace LangMcpCommon;

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    app.setApplicationName("langmcp-tests");

    LangMcpLoggerConfig logConfig;
    logConfig.appName = "tests";
    logConfig.consoleEnabled = true;
    logConfig.consoleColors = true;
    logConfig.minLevel = qEnvironmentVariableIsSet("LANGMCP_TEST_DEBUG") ? LogLevel::Debug : LogLevel::Info;
    LangMcpLogger::initialize(logConfig);

    using SuiteRunner = int (*)(int&, int&);
    const QList<SuiteRunner> suites = {
        runCliArgumentTests,
        runToolRegistryTests,
        runToolDispatcherTests,
        runSessionTransportTests,
        runHttpRequestTests,
        runProtocolServerTests,
        runFrontDoorTests,
        runLspTests
    };

    int grandTotal = 0;
    int grandPassed = 0;
    int grandFailed = 0;

    for (const auto& suite : suites) {
        int total = 0;
        int passed = 0;
        grandFailed += suite(total, passed);
        grandTotal += total;
        grandPassed += passed;
    }

    LangMcpLogger::instance().info("\n===============================================");
    LangMcpLogger::instance().info(QString("Total: %1 tests, %2 passed, %3 failed")
        .arg(grandTotal).arg(grandPassed).arg(grandFailed));
    LangMcpLogger::instance().info("===============================================");

    return grandFailed == 0 ? static_cast<int>(ExitCode::SUCCESS) : static_cast<int>(ExitCode::TESTS_FAILED);
}
