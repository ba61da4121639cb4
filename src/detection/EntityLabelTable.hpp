#pragma once

#include "SpanCandidate.hpp"

#include <map>
#include <string>
#include <string_view>
#include <unordered_map>

namespace detection
{

// Immutable mapping from entity tag to the display label used in masks.
class EntityLabelTable
{
public:
    static constexpr std::string_view kFallbackLabel = "機密情報";

    // Built-in labels only
    EntityLabelTable();

    // Built-in labels with per-tag overrides layered on top
    explicit EntityLabelTable(const std::map<std::string, std::string>& overrides);

    [[nodiscard]] const std::string& labelForTag(std::string_view tag) const;
    [[nodiscard]] const std::string& labelFor(const SpanCandidate& candidate) const;

    bool contains(std::string_view tag) const;
    std::size_t size() const { return labels_.size(); }

private:
    std::unordered_map<std::string, std::string> labels_;
    std::string fallback_;
};

} // namespace detection
