#include "CommandLine.hpp"

namespace cli
{

namespace
{

bool isOption(const std::string& arg) { return arg.size() > 1 && arg.front() == '-'; }

} // namespace

bool parseCommandLine(const std::vector<std::string>& args, CommandLineOptions& options)
{
    options = CommandLineOptions{};

    for (std::size_t i = 0; i < args.size(); ++i)
    {
        const std::string& arg = args[i];
        if (arg == "-h" || arg == "--help")
        {
            options.command = Command::Help;
            return true;
        }
        if (arg == "--config")
        {
            if (i + 1 >= args.size())
            {
                options.error = "--config requires a path";
                return false;
            }
            options.config_path = args[++i];
        }
        else if (arg == "--use-context")
        {
            options.use_context = true;
        }
        else if (arg == "--json")
        {
            options.json = true;
        }
        else if (isOption(arg))
        {
            options.error = "Unknown option: " + arg;
            return false;
        }
        else
        {
            options.positional.push_back(arg);
        }
    }

    auto& positional = options.positional;
    if (!positional.empty() && positional.front() == "dict")
    {
        options.command = Command::Dict;
        positional.erase(positional.begin());
        if (positional.empty())
        {
            options.error = "dict requires an action";
            return false;
        }
        return true;
    }
    if (!positional.empty() && positional.front() == "status")
    {
        options.command = Command::Status;
        positional.erase(positional.begin());
        if (!positional.empty())
        {
            options.error = "status takes no arguments";
            return false;
        }
        return true;
    }

    options.command = Command::Redact;
    if (positional.size() > 1)
    {
        options.error = "Only one input file may be given";
        return false;
    }
    return true;
}

} // namespace cli
