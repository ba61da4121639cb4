#pragma once

#include <string>
#include <vector>

namespace cli
{

enum class Command
{
    Redact,
    Dict,
    Status,
    Help
};

struct CommandLineOptions
{
    Command command = Command::Redact;
    std::string config_path = "config.toml";
    bool use_context = false;
    bool json = false;
    // Arguments after the command word; for Redact at most one input path
    std::vector<std::string> positional;
    // Why parsing failed, empty on success
    std::string error;

    // Input path for Redact; "-" reads standard input
    std::string inputPath() const { return positional.empty() ? std::string("-") : positional.front(); }
};

/**
 * @brief Parses arguments without the program name.
 *
 * Options may appear anywhere. "-h"/"--help" wins over everything after it.
 * A lone "-" is a positional argument meaning standard input.
 *
 * @return false on an unknown option or a wrong argument count; the reason
 *         is left in options.error
 */
bool parseCommandLine(const std::vector<std::string>& args, CommandLineOptions& options);

} // namespace cli
