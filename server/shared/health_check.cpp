#include "health_check.h"
#include "langmcplogger.h"
#include "common.h"
#include "cli_args.h"
#include "test_cli_args.h"
#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>
#include <QTcpServer>
#include <QTemporaryFile>

using namespace LangMcpCommon;

namespace LangMcpHealthCheck {

void printCheckResult(const CheckResult& result, bool verbose) {
    QString prefix;
    LogLevel level = LogLevel::Info;

    switch (result.status) {
        case CheckStatus::Passed:
            prefix = "  ✓";
            level = LogLevel::Info;
            break;
        case CheckStatus::Warning:
            prefix = "  ⚠";
            level = LogLevel::Warning;
            break;
        case CheckStatus::Failed:
            prefix = "  ✗";
            level = LogLevel::Error;
            break;
    }

    QString output = QString("%1 %2").arg(prefix).arg(result.test);
    if (!result.message.isEmpty() && (verbose || result.status != CheckStatus::Passed)) {
        output += QString(": %1").arg(result.message);
    }

    LangMcpLogger::instance().log(level, "", output);
}

HealthCheckSummary calculateSummary(const QList<CheckResult>& results) {
    HealthCheckSummary summary = {0, 0, 0, false, ""};

    for (const auto& result : results) {
        switch (result.status) {
            case CheckStatus::Passed:
                summary.passed++;
                break;
            case CheckStatus::Warning:
                summary.warnings++;
                break;
            case CheckStatus::Failed:
                summary.failed++;
                if (result.critical) {
                    summary.hasBlockingFailures = true;
                }
                break;
        }
    }

    if (summary.hasBlockingFailures) {
        summary.overallStatus = "FAILED (Critical errors)";
    } else if (summary.failed > 0) {
        summary.overallStatus = "FAILED";
    } else if (summary.warnings > 0) {
        summary.overallStatus = "PASSED with warnings";
    } else {
        summary.overallStatus = "PASSED";
    }

    return summary;
}

void printSummary(const HealthCheckSummary& summary) {
    LangMcpLogger::instance().info("\n[Summary]");
    LangMcpLogger::instance().info(QString("  Tests: %1 passed, %2 warnings, %3 failed")
        .arg(summary.passed)
        .arg(summary.warnings)
        .arg(summary.failed));

    if (summary.failed > 0) {
        LangMcpLogger::instance().error(QString("  Result: %1").arg(summary.overallStatus));
    } else if (summary.warnings > 0) {
        LangMcpLogger::instance().warning(QString("  Result: %1").arg(summary.overallStatus));
    } else {
        LangMcpLogger::instance().info(QString("  Result: %1").arg(summary.overallStatus));
    }
}

void printSystemInformation(const HealthCheckConfig& config) {
    LangMcpLogger::instance().info("\n[System Information]");
    LangMcpLogger::instance().info(QString("  Version:     %1").arg(Config::APP_VERSION));
    LangMcpLogger::instance().info(QString("  Qt version:  %1").arg(qVersion()));

    #ifdef QT_DEBUG
    QString buildType = "Debug";
    #else
    QString buildType = "Release";
    #endif
    LangMcpLogger::instance().info(QString("  Build type:  %1").arg(buildType));
    LangMcpLogger::instance().info(QString("  Binary:      %1").arg(config.binaryName));

    if (config.verbose) {
        LangMcpLogger::instance().info(QString("  Log path:    %1").arg(LangMcpLogger::getBaseLogDir()));
        if (config.serverConfig) {
            LangMcpLogger::instance().info(QString("  Workspace:   %1").arg(config.serverConfig->getWorkspacePath()));
        }
    }
}

QList<CheckResult> checkNetworking(const HealthCheckConfig& config) {
    QList<CheckResult> results;

    quint16 testPort = config.testPort;
    if (testPort == 0) {
        quint16 boundPort = 0;
        bool usedFallback = false;
        auto listener = bindListener(0, boundPort, usedFallback);
        if (listener && boundPort != 0) {
            results.append({
                "Networking",
                "Port allocation",
                CheckStatus::Passed,
                QString("Allocated port %1").arg(boundPort),
                false
            });
            listener->close();
        } else {
            results.append({
                "Networking",
                "Port allocation",
                CheckStatus::Failed,
                "Could not allocate port",
                true
            });
        }
    } else {
        // The server falls back to an OS-assigned port, so a busy preferred port is only a warning
        if (isPortAvailable(testPort)) {
            results.append({
                "Networking",
                "Preferred port",
                CheckStatus::Passed,
                QString("Can bind to port %1").arg(testPort),
                false
            });
        } else {
            results.append({
                "Networking",
                "Preferred port",
                CheckStatus::Warning,
                QString("Port %1 is in use, an OS-assigned port will be used").arg(testPort),
                false
            });
        }
    }

    return results;
}

QList<CheckResult> checkFileSystem(const HealthCheckConfig& config) {
    QList<CheckResult> results;

    QString logDir = LangMcpLogger::getBaseLogDir();
    QDir logDirectory(logDir);
    if (!logDirectory.exists() && !logDirectory.mkpath(".")) {
        results.append({
            "File System",
            "Log directory",
            CheckStatus::Failed,
            QString("Cannot create: %1").arg(logDir),
            true
        });
    } else {
        QTemporaryFile testFile(logDirectory.absoluteFilePath("langmcp_test_XXXXXX"));
        if (testFile.open()) {
            results.append({
                "File System",
                "Log directory",
                CheckStatus::Passed,
                QString("Writable: %1").arg(logDir),
                false
            });
            testFile.close();
        } else {
            results.append({
                "File System",
                "Log directory",
                CheckStatus::Failed,
                QString("Not writable: %1").arg(logDir),
                true
            });
        }
    }

    if (config.serverConfig) {
        QFileInfo workspace(config.serverConfig->getWorkspacePath());
        if (workspace.isDir() && workspace.isReadable()) {
            results.append({
                "File System",
                "Workspace",
                CheckStatus::Passed,
                workspace.absoluteFilePath(),
                false
            });
        } else {
            results.append({
                "File System",
                "Workspace",
                CheckStatus::Failed,
                QString("Not a readable directory: %1").arg(workspace.absoluteFilePath()),
                true
            });
        }
    }

    return results;
}

QList<CheckResult> checkLanguageServer(const HealthCheckConfig& config) {
    QList<CheckResult> results;

    QString command = config.serverConfig
        ? config.serverConfig->getLspCommand()
        : QString(Config::DEFAULT_LSP_COMMAND);

    QString resolved;
    QFileInfo direct(command);
    if (command.contains('/') && direct.isFile() && direct.isExecutable()) {
        resolved = direct.absoluteFilePath();
    } else {
        resolved = QStandardPaths::findExecutable(command);
    }

    // Lookups fail at call time without a language server, startup still succeeds
    if (resolved.isEmpty()) {
        results.append({
            "Language Server",
            "Executable",
            CheckStatus::Warning,
            QString("'%1' not found on PATH, find_usages calls will fail").arg(command),
            false
        });
    } else {
        results.append({
            "Language Server",
            "Executable",
            CheckStatus::Passed,
            resolved,
            false
        });
    }

    return results;
}

int runHealthCheck(const HealthCheckConfig& config) {
    LangMcpLogger::instance().info("===============================================");
    LangMcpLogger::instance().info("LangMcp System Health Check");
    LangMcpLogger::instance().info(QString("Binary: %1").arg(config.binaryName));
    LangMcpLogger::instance().info("===============================================");

    printSystemInformation(config);

    QList<CheckResult> allResults;

    auto runCategory = [&](const QString& title, const QList<CheckResult>& results) {
        LangMcpLogger::instance().info(QString("\n[%1]").arg(title));
        for (const auto& result : results) {
            printCheckResult(result, config.verbose);
            allResults.append(result);
        }
    };

    runCategory("Networking", checkNetworking(config));
    runCategory("File System", checkFileSystem(config));
    runCategory("Language Server", checkLanguageServer(config));

    if (config.runTests) {
        int totalTests = 0;
        int passedTests = 0;
        int failedTests = runCliArgumentTests(totalTests, passedTests);
        allResults.append({
            "System Tests",
            "CLI argument parsing",
            failedTests == 0 ? CheckStatus::Passed : CheckStatus::Failed,
            failedTests == 0
                ? QString("All %1 tests passed").arg(totalTests)
                : QString("%1 of %2 tests failed").arg(failedTests).arg(totalTests),
            false
        });
    }

    auto summary = calculateSummary(allResults);
    printSummary(summary);

    LangMcpLogger::instance().info("\n===============================================");
    if (summary.hasBlockingFailures || summary.failed > 0) {
        LangMcpLogger::instance().error("CHECK FAILED");
        LangMcpLogger::instance().info("===============================================");
        return 1;
    } else if (summary.warnings > 0 && config.strictMode) {
        LangMcpLogger::instance().warning("CHECK FAILED (strict mode - warnings treated as errors)");
        LangMcpLogger::instance().info("===============================================");
        return 1;
    } else {
        LangMcpLogger::instance().info("CHECK PASSED");
        LangMcpLogger::instance().info("===============================================");
        return 0;
    }
}

} // namespace LangMcpHealthCheck
