#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include <string_view>

namespace detection
{

// Detection-side logging switches. Text passing through the engine may
// itself be sensitive, so it only reaches a log through Preview().
class Diagnostics
{
public:
    static constexpr int kLogInstance = 1;
    static constexpr std::size_t kPreviewCodepoints = 24;

    static void SetVerbose(bool enabled) noexcept { verbose_.store(enabled, std::memory_order_relaxed); }
    static bool IsVerbose() noexcept { return verbose_.load(std::memory_order_relaxed); }

    // First max_codepoints codepoints of UTF-8 text with control bytes
    // escaped as \xNN, followed by "...(N bytes)" when truncated.
    static std::string Preview(std::string_view text, std::size_t max_codepoints = kPreviewCodepoints);

private:
    static std::atomic<bool> verbose_;
};

} // namespace detection
