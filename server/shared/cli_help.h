#ifndef CLI_HELP_H
#define CLI_HELP_H

#include <string>

namespace LangMcpCLI {

/**
 * Generate complete help text for command-line usage
 * @param programName Name of the executable (e.g., "langmcp-server")
 * @return Formatted help text string ready for console output
 */
std::string generateHelpText(const char* programName);

/**
 * Generate version string with optional commit hash
 * @return Version string in format "langmcp-server version X.Y.Z (commit)"
 */
std::string generateVersionString();

} // namespace LangMcpCLI

#endif // CLI_HELP_H
