#include "cli_help.h"
#include "common.h"
#include <sstream>

namespace LangMcpCLI {

std::string generateHelpText(const char* programName) {
    std::ostringstream help;

    help << "Usage: " << programName << " [options]\n"
         << "Options:\n"
         << "\n"
         << "Network:\n"
         << "  --port <n>               Preferred port (default: " << LangMcpCommon::Config::DEFAULT_PORT << ")\n"
         << "                           Falls back to an OS-assigned port when taken\n"
         << "  --allow-remote           Listen on all interfaces (default: 127.0.0.1 only)\n"
         << "\n"
         << "Language Server:\n"
         << "  --lsp-command <cmd>      Language server used to find references\n"
         << "                           (default: " << LangMcpCommon::Config::DEFAULT_LSP_COMMAND << ")\n"
         << "  --lsp-arg <arg>          Extra argument for the language server (repeatable)\n"
         << "  --workspace <dir>        Workspace root (default: current directory)\n"
         << "  --provider-timeout <ms>  Timeout per reference lookup, 0 disables\n"
         << "                           (default: " << LangMcpCommon::Config::DEFAULT_PROVIDER_TIMEOUT_MS << ")\n"
         << "\n"
         << "Other:\n"
         << "  --verbose                Log to the console as well as to log files\n"
         << "  --check                  Verify installation and exit\n"
         << "  --dry-run                Show the resolved configuration and exit\n"
         << "  --help, -h               Show this help message\n"
         << "  --version                Show version information\n"
         << "\n"
         << "Environment:\n"
         << "  LANGMCP_PORT, LANGMCP_LSP_COMMAND, LANGMCP_WORKSPACE,\n"
         << "  LANGMCP_PROVIDER_TIMEOUT_MS  Defaults overridden by the flags above\n"
         << "\n"
         << "LangMcp - MCP server exposing find_usages over SSE\n"
         << "Connect an MCP client to http://localhost:<port>/sse\n";

    return help.str();
}

std::string generateVersionString() {
    std::ostringstream version;

    version << "langmcp-server version " << LangMcpCommon::Config::APP_VERSION;

    if (std::string(LangMcpCommon::Config::APP_COMMIT) != "unknown") {
        version << " (" << LangMcpCommon::Config::APP_COMMIT << ")";
    }

    return version.str();
}

} // namespace LangMcpCLI
