#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace detection
{

// Raw result of a pattern-analysis capability. Offsets are codepoint
// offsets into the analyzed text; the engine validates them.
struct AnalyzerResult
{
    std::string entity_type;
    std::size_t start = 0;
    std::size_t end = 0;
    double score = 0.0;
    std::string pattern_name;
};

class IPatternAnalyzer
{
public:
    virtual ~IPatternAnalyzer() = default;

    virtual const char* analyzerName() const = 0;

    // Must be safe to call concurrently from several threads.
    virtual std::vector<AnalyzerResult> analyze(const std::wstring& text) const = 0;
};

} // namespace detection
