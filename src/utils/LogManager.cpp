#include "LogManager.hpp"
#include "ErrorReporter.hpp"
#include "Profile.hpp"
#include "../detection/Diagnostics.hpp"

#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>

namespace utils
{

bool LogManager::s_initialized = false;
LogOptions LogManager::s_options;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

bool LogManager::Initialize(const LogOptions& options)
{
    if (s_initialized)
        return true;

    s_options = options;
    if (!attach<0>(options.main_file, options.level, options.console))
        return false;

    s_initialized = true;
    return true;
}

template<int InstanceId>
bool LogManager::AttachChannel(std::string_view file_name, std::optional<plog::Severity> level)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Log channel attached before initialization",
                                   std::string(file_name));
        return false;
    }
    return attach<InstanceId>(ChannelPath(file_name), level.value_or(s_options.level), false);
}

template<int InstanceId>
bool LogManager::attach(const std::filesystem::path& file, plog::Severity level, bool console)
{
    try
    {
        if (file.has_parent_path())
            std::filesystem::create_directories(file.parent_path());

        auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            file.string().c_str(), s_options.max_file_size, s_options.backup_count);
        auto& logger = plog::init<InstanceId>(level, file_appender.get());
        s_appenders.push_back(std::move(file_appender));

        if (console)
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>(plog::streamStdErr);
            logger.addAppender(console_appender.get());
            s_appenders.push_back(std::move(console_appender));
        }
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Cannot open log file " + file.string(),
                                   ex.what());
        return false;
    }
}

template bool LogManager::AttachChannel<detection::Diagnostics::kLogInstance>(std::string_view,
                                                                              std::optional<plog::Severity>);
#if SHIELDAI_PROFILING_LEVEL >= 1
template bool LogManager::AttachChannel<profiling::kProfilingLogInstance>(std::string_view,
                                                                          std::optional<plog::Severity>);
#endif

std::filesystem::path LogManager::ChannelPath(std::string_view file_name)
{
    return std::filesystem::path(s_options.main_file).parent_path() / std::filesystem::path(file_name);
}

void LogManager::Shutdown()
{
    if (s_initialized)
        PLOG_INFO << "Log shutdown";
    s_appenders.clear();
    s_initialized = false;
}

} // namespace utils
