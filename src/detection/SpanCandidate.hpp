#pragma once

#include "EntityType.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace detection
{

// A detected substring. Offsets are half-open codepoint offsets into the
// original text and matched_text is the UTF-8 form of text[start:end].
struct SpanCandidate
{
    EntityType entity_type = EntityType::Other;
    std::string entity_tag;   // Display tag, e.g. "JP_PHONE_NUMBER" or an analyzer's own tag
    std::string matched_text;
    std::size_t start = 0;
    std::size_t end = 0;
    double score = 0.0;
    SourceMethod source_method = SourceMethod::Pattern;
    std::string label_hint;   // Dictionary term label, empty for other sources

    std::size_t length() const { return end - start; }

    bool overlaps(const SpanCandidate& other) const
    {
        return !(end <= other.start || start >= other.end);
    }
};

// Output of one detect() run
struct DetectionResult
{
    std::string original_text;
    std::string masked_text;
    std::vector<SpanCandidate> detections; // retained candidates, original detection order
    double processing_time_ms = 0.0;
};

} // namespace detection
