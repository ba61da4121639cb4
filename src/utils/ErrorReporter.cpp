#include "ErrorReporter.hpp"

#include <plog/Log.h>

namespace utils
{

std::mutex ErrorReporter::s_mutex;
std::deque<ErrorReport> ErrorReporter::s_pending;

namespace
{

plog::Severity toPlogSeverity(ErrorSeverity severity)
{
    switch (severity)
    {
    case ErrorSeverity::Info:
        return plog::info;
    case ErrorSeverity::Warning:
        return plog::warning;
    case ErrorSeverity::Error:
        return plog::error;
    }
    return plog::error;
}

} // namespace

void ErrorReporter::Report(ErrorCategory category, ErrorSeverity severity, const std::string& summary,
                           const std::string& details)
{
    PLOG(toPlogSeverity(severity)) << "[" << CategoryName(category) << "] " << summary
                                   << (details.empty() ? "" : " | ") << details;

    ErrorReport report;
    report.category = category;
    report.severity = severity;
    report.summary = summary;
    report.details = details;
    report.reported_at = std::chrono::system_clock::now();

    std::lock_guard<std::mutex> lock(s_mutex);
    s_pending.push_back(std::move(report));
    while (s_pending.size() > kMaxPending)
        s_pending.pop_front();
}

bool ErrorReporter::HasPending()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return !s_pending.empty();
}

std::vector<ErrorReport> ErrorReporter::TakePending(ErrorSeverity minimum)
{
    std::deque<ErrorReport> taken;
    {
        std::lock_guard<std::mutex> lock(s_mutex);
        taken.swap(s_pending);
    }

    std::vector<ErrorReport> reports;
    for (auto& report : taken)
    {
        if (report.severity >= minimum)
            reports.push_back(std::move(report));
    }
    return reports;
}

ErrorReport ErrorReporter::LastReport()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_pending.empty() ? ErrorReport{} : s_pending.back();
}

void ErrorReporter::Clear()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_pending.clear();
}

const char* ErrorReporter::CategoryName(ErrorCategory category)
{
    switch (category)
    {
    case ErrorCategory::Initialization:
        return "Initialization";
    case ErrorCategory::Configuration:
        return "Configuration";
    case ErrorCategory::Dictionary:
        return "Dictionary";
    case ErrorCategory::PatternAnalysis:
        return "Pattern Analysis";
    case ErrorCategory::ContextDetector:
        return "Context Detector";
    case ErrorCategory::Unknown:
        break;
    }
    return "Unknown";
}

const char* ErrorReporter::SeverityName(ErrorSeverity severity)
{
    switch (severity)
    {
    case ErrorSeverity::Info:
        return "info";
    case ErrorSeverity::Warning:
        return "warning";
    case ErrorSeverity::Error:
        return "error";
    }
    return "unknown";
}

} // namespace utils
