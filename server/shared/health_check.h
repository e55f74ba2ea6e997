#ifndef LANGMCP_HEALTH_CHECK_H
#define LANGMCP_HEALTH_CHECK_H

#include <QString>
#include <QList>

namespace LangMcpCLI {
    class ServerConfig;
}

namespace LangMcpHealthCheck {

    enum class CheckStatus {
        Passed,
        Warning,
        Failed
    };

    struct CheckResult {
        QString category;
        QString test;
        CheckStatus status;
        QString message;
        bool critical;  // If true, failure means the server won't work
    };

    struct HealthCheckConfig {
        QString binaryName;
        bool verbose;
        bool strictMode;       // Fail on warnings for CI
        bool runTests;         // Run CLI argument tests
        quint16 testPort;      // Port to test binding (0 = auto)
        const LangMcpCLI::ServerConfig* serverConfig;  // Optional server configuration
    };

    struct HealthCheckSummary {
        int passed;
        int warnings;
        int failed;
        bool hasBlockingFailures;
        QString overallStatus;
    };

    // Main health check function
    // Returns exit code (0 = success, 1 = failure)
    int runHealthCheck(const HealthCheckConfig& config);

    // Individual check categories (exposed for testing)
    void printSystemInformation(const HealthCheckConfig& config);
    QList<CheckResult> checkNetworking(const HealthCheckConfig& config);
    QList<CheckResult> checkFileSystem(const HealthCheckConfig& config);
    QList<CheckResult> checkLanguageServer(const HealthCheckConfig& config);

    // Utility functions
    void printCheckResult(const CheckResult& result, bool verbose);
    void printSummary(const HealthCheckSummary& summary);
    HealthCheckSummary calculateSummary(const QList<CheckResult>& results);
}

#endif // LANGMCP_HEALTH_CHECK_H
