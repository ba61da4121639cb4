#pragma once

#include "EntityType.hpp"
#include "IPatternAnalyzer.hpp"

#include <functional>
#include <regex>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace detection
{

// One regular expression with its fixed confidence score
struct PatternDefinition
{
    std::string name;        // e.g. "JP_PHONE_MOBILE"
    std::wstring expression; // ECMAScript syntax over codepoints
    double score = 0.0;
};

// Post-match predicate; false drops the match
using MatchValidator = std::function<bool(std::wstring_view)>;

/**
 * @brief A set of regular expressions reporting a single entity type.
 *
 * Every pattern is scanned independently over the whole text, so matches
 * from different patterns may overlap. Patterns always compile with icase;
 * an expression that must cross line breaks spells it out with [\s\S]. Matches rejected by the validator
 * or equal to a deny-listed phrase never leave the recognizer.
 */
class PatternRecognizer
{
public:
    PatternRecognizer(std::string name, EntityType entity_type, std::vector<PatternDefinition> patterns);

    PatternRecognizer& setValidator(MatchValidator validator);
    PatternRecognizer& setDenyList(std::unordered_set<std::wstring> deny_list);

    [[nodiscard]] std::vector<AnalyzerResult> analyze(const std::wstring& text) const;

    const std::string& name() const { return name_; }
    EntityType entityType() const { return entity_type_; }
    std::size_t patternCount() const { return patterns_.size(); }

private:
    struct CompiledPattern
    {
        PatternDefinition definition;
        std::wregex regex;
    };

    bool accept(std::wstring_view matched) const;

    std::string name_;
    EntityType entity_type_;
    std::vector<CompiledPattern> patterns_;
    MatchValidator validator_;
    std::unordered_set<std::wstring> deny_list_;
};

} // namespace detection
