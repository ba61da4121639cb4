#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace utils
{

struct LogOptions
{
    plog::Severity level = plog::info;
    std::string main_file = "logs/shieldai.log";
    bool console = false; // mirror the main channel to stderr
    std::size_t max_file_size = 10 * 1024 * 1024;
    int backup_count = 3;
};

/**
 * @brief Owns the plog appenders for every log channel.
 *
 * Channel 0 is the main log at LogOptions::main_file. Further channels
 * (diagnostics, profiling) write to their own file in the same directory.
 * stdout is never used so redacted output stays clean.
 */
class LogManager
{
public:
    static bool Initialize(const LogOptions& options);

    // Attach plog instance InstanceId to file_name beside the main log
    template<int InstanceId>
    static bool AttachChannel(std::string_view file_name, std::optional<plog::Severity> level = std::nullopt);

    static std::filesystem::path ChannelPath(std::string_view file_name);

    static bool IsInitialized() { return s_initialized; }
    static void Shutdown();

private:
    template<int InstanceId>
    static bool attach(const std::filesystem::path& file, plog::Severity level, bool console);

    static bool s_initialized;
    static LogOptions s_options;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
