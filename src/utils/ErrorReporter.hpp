#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace utils {

enum class ErrorCategory
{
    Initialization,  // logging setup
    Configuration,   // config.toml parsing
    Dictionary,      // dictionary file load/save, CSV import
    PatternAnalysis, // analyzer failures, invalid spans
    ContextDetector, // Ollama probe and request failures
    Unknown
};

enum class ErrorSeverity
{
    Info,
    Warning, // degraded, the run continues
    Error,   // the operation failed
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string summary;
    std::string details;
    std::chrono::system_clock::time_point reported_at{};
};

/**
 * @brief Process-wide queue of recoverable failures.
 *
 * Detection never throws past the engine; subsystems that degrade record
 * what happened here so the command-line front end can print it after the
 * run. Every report is also written to the main plog instance.
 *
 *   ErrorReporter::ReportWarning(ErrorCategory::ContextDetector,
 *                                "Context detection failed", "HTTP 503");
 *   for (const auto& r : ErrorReporter::TakePending(ErrorSeverity::Warning)) { ... }
 */
class ErrorReporter
{
public:
    static void Report(ErrorCategory category, ErrorSeverity severity, const std::string& summary,
                       const std::string& details = "");

    static void ReportWarning(ErrorCategory category, const std::string& summary, const std::string& details = "")
    {
        Report(category, ErrorSeverity::Warning, summary, details);
    }

    static void ReportError(ErrorCategory category, const std::string& summary, const std::string& details = "")
    {
        Report(category, ErrorSeverity::Error, summary, details);
    }

    static bool HasPending();

    // Remove and return every queued report at or above minimum, oldest first
    static std::vector<ErrorReport> TakePending(ErrorSeverity minimum = ErrorSeverity::Info);

    // Most recent queued report, or a default-constructed one
    static ErrorReport LastReport();

    static void Clear();

    static const char* CategoryName(ErrorCategory category);
    static const char* SeverityName(ErrorSeverity severity);

private:
    static constexpr std::size_t kMaxPending = 64;

    static std::mutex s_mutex;
    static std::deque<ErrorReport> s_pending;
};

} // namespace utils
