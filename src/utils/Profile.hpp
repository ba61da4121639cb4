#pragma once

// SHIELDAI_PROFILING_LEVEL comes from CMake:
//   0  scopes compile away
//   1  scope durations written to the profiling plog channel
//   2  as 1, plus Tracy zones

#ifndef SHIELDAI_PROFILING_LEVEL
#define SHIELDAI_PROFILING_LEVEL 0
#endif

#if SHIELDAI_PROFILING_LEVEL >= 1
#include <chrono>
#include <string>
#include <utility>

#include <plog/Log.h>
#endif

#if SHIELDAI_PROFILING_LEVEL >= 2
#include <tracy/Tracy.hpp>
#endif

namespace profiling
{

#if SHIELDAI_PROFILING_LEVEL >= 1
constexpr int kProfilingLogInstance = 2;

namespace detail
{

// Logs the lifetime of a scope in milliseconds
class ScopeTimer
{
public:
    explicit ScopeTimer(std::string name)
        : name_(std::move(name))
        , start_(std::chrono::steady_clock::now())
    {
    }

    ~ScopeTimer()
    {
        const std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - start_;
        PLOG_DEBUG_(kProfilingLogInstance) << "[profile] " << name_ << ": " << elapsed.count() << " ms";
    }

    ScopeTimer(const ScopeTimer&) = delete;
    ScopeTimer& operator=(const ScopeTimer&) = delete;

    const char* name() const { return name_.c_str(); }

private:
    std::string name_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace detail
#endif

} // namespace profiling

#if SHIELDAI_PROFILING_LEVEL == 0
#define PROFILE_SCOPE_FUNCTION() ((void)0)
#define PROFILE_SCOPE_CUSTOM(nameExpr) ((void)sizeof(nameExpr))

#elif SHIELDAI_PROFILING_LEVEL == 1
#define PROFILE_SCOPE_FUNCTION() ::profiling::detail::ScopeTimer shieldai_scope_timer_(__func__)
#define PROFILE_SCOPE_CUSTOM(nameExpr) ::profiling::detail::ScopeTimer shieldai_scope_timer_(nameExpr)

#else
#define PROFILE_SCOPE_FUNCTION()                                          \
    ::profiling::detail::ScopeTimer shieldai_scope_timer_(__func__); \
    ZoneScoped
#define PROFILE_SCOPE_CUSTOM(nameExpr)                                    \
    ::profiling::detail::ScopeTimer shieldai_scope_timer_(nameExpr); \
    ZoneTransientN(shieldai_tracy_zone_, shieldai_scope_timer_.name(), true)
#endif
