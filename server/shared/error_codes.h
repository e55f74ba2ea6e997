#ifndef ERROR_CODES_H
#define ERROR_CODES_H

#include <iostream>
#include <QString>

namespace LangMcpCommon {

    // Exit codes for langmcp applications
    enum class ExitCode : int {
        SUCCESS = 0,

        // General errors (1-19)
        GENERAL_ERROR = 1,
        INVALID_ARGUMENTS = 2,
        CONFIGURATION_ERROR = 3,
        TESTS_FAILED = 4,

        // File/Directory errors (20-39)
        WORKSPACE_NOT_FOUND = 20,
        PERMISSION_DENIED = 22,

        // Network errors (40-59)
        PORT_ALLOCATION_FAILED = 40,
        PORT_IN_USE = 41,
        NETWORK_INIT_FAILED = 42,

        // Process errors (60-79)
        SIGNAL_HANDLER_FAILED = 63,

        // Language server errors (90-99)
        LANGUAGE_SERVER_NOT_FOUND = 90,
        LANGUAGE_SERVER_START_FAILED = 91,

        // Logger errors (100-109)
        LOGGER_INIT_FAILED = 100,
        LOG_DIR_CREATE_FAILED = 101,

        // MCP Server errors (110-119)
        MCP_SERVER_FAILED = 110,
        MCP_SERVER_ALREADY_RUNNING = 111
    };

    inline const char* exitCodeToString(ExitCode code) {
        switch (code) {
            case ExitCode::SUCCESS: return "Success";
            case ExitCode::GENERAL_ERROR: return "General error";
            case ExitCode::INVALID_ARGUMENTS: return "Invalid command line arguments";
            case ExitCode::CONFIGURATION_ERROR: return "Configuration error";
            case ExitCode::TESTS_FAILED: return "One or more tests failed";

            case ExitCode::WORKSPACE_NOT_FOUND: return "Workspace directory not found";
            case ExitCode::PERMISSION_DENIED: return "Permission denied";

            case ExitCode::PORT_ALLOCATION_FAILED: return "Failed to allocate network port";
            case ExitCode::PORT_IN_USE: return "Port already in use";
            case ExitCode::NETWORK_INIT_FAILED: return "Network initialization failed";

            case ExitCode::SIGNAL_HANDLER_FAILED: return "Failed to setup signal handlers";

            case ExitCode::LANGUAGE_SERVER_NOT_FOUND: return "Language server executable not found";
            case ExitCode::LANGUAGE_SERVER_START_FAILED: return "Language server failed to start";

            case ExitCode::LOGGER_INIT_FAILED: return "Logger initialization failed";
            case ExitCode::LOG_DIR_CREATE_FAILED: return "Failed to create log directory";

            case ExitCode::MCP_SERVER_FAILED: return "MCP server failed";
            case ExitCode::MCP_SERVER_ALREADY_RUNNING: return "MCP server is already running";

            default: return "Unknown error";
        }
    }

    // Print the exit code description (plus optional details) and return the numeric code
    inline int reportExit(ExitCode code, const QString& additionalInfo = QString()) {
        if (!additionalInfo.isEmpty()) {
            std::cerr << exitCodeToString(code) << ": " << additionalInfo.toStdString() << std::endl;
        } else {
            std::cerr << exitCodeToString(code) << std::endl;
        }
        return static_cast<int>(code);
    }
}

#endif // ERROR_CODES_H
