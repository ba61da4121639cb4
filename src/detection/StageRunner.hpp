#pragma once

#include "Diagnostics.hpp"

#include <chrono>
#include <exception>
#include <optional>
#include <string>
#include <utility>

#include <plog/Log.h>

#include "../utils/ErrorReporter.hpp"
#include "../utils/Profile.hpp"

namespace detection
{

// Outcome of one detection stage
template<typename T>
struct StageResult
{
    T result{};                          // Stage output, default-constructed on failure
    bool succeeded = true;
    std::optional<std::string> error;
    std::chrono::microseconds duration{ 0 };
    std::string stage_name;

    static StageResult success(T r, std::chrono::microseconds time, const std::string& name)
    {
        StageResult res;
        res.result = std::move(r);
        res.succeeded = true;
        res.duration = time;
        res.stage_name = name;
        return res;
    }

    static StageResult failure(const std::string& err, std::chrono::microseconds time, const std::string& name)
    {
        StageResult res;
        res.succeeded = false;
        res.error = err;
        res.duration = time;
        res.stage_name = name;
        return res;
    }
};

// Run a stage (callable returning T) and wrap the outcome. A throwing stage is
// logged and reported, and contributes an empty result.
template<typename T, typename Fn>
StageResult<T> run_stage(const std::string& stage_name, Fn&& fn)
{
    PROFILE_SCOPE_CUSTOM(stage_name);

    using namespace std::chrono;
    auto start = steady_clock::now();
    try
    {
        T res = fn();
        auto dur = duration_cast<microseconds>(steady_clock::now() - start);
        if (Diagnostics::IsVerbose())
        {
            PLOG_INFO_(Diagnostics::kLogInstance) << "Stage '" << stage_name << "' succeeded in " << dur.count()
                                                  << "us";
        }
        return StageResult<T>::success(std::move(res), dur, stage_name);
    }
    catch (const std::exception& ex)
    {
        auto dur = duration_cast<microseconds>(steady_clock::now() - start);
        PLOG_ERROR_(Diagnostics::kLogInstance) << "Stage '" << stage_name << "' failed in " << dur.count()
                                               << "us: " << ex.what();
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::PatternAnalysis, "Detection stage failed",
                                            stage_name + ": " + ex.what());
        return StageResult<T>::failure(ex.what(), dur, stage_name);
    }
}

} // namespace detection
