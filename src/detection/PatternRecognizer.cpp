#include "PatternRecognizer.hpp"

namespace detection
{

namespace
{

constexpr auto kPatternFlags =
    std::regex_constants::ECMAScript | std::regex_constants::icase | std::regex_constants::optimize;

} // namespace

PatternRecognizer::PatternRecognizer(std::string name, EntityType entity_type,
                                     std::vector<PatternDefinition> patterns)
    : name_(std::move(name))
    , entity_type_(entity_type)
{
    patterns_.reserve(patterns.size());
    for (auto& def : patterns)
    {
        std::wregex compiled(def.expression, kPatternFlags);
        patterns_.push_back({ std::move(def), std::move(compiled) });
    }
}

PatternRecognizer& PatternRecognizer::setValidator(MatchValidator validator)
{
    validator_ = std::move(validator);
    return *this;
}

PatternRecognizer& PatternRecognizer::setDenyList(std::unordered_set<std::wstring> deny_list)
{
    deny_list_ = std::move(deny_list);
    return *this;
}

bool PatternRecognizer::accept(std::wstring_view matched) const
{
    if (!deny_list_.empty() && deny_list_.count(std::wstring(matched)) > 0)
        return false;
    if (validator_ && !validator_(matched))
        return false;
    return true;
}

std::vector<AnalyzerResult> PatternRecognizer::analyze(const std::wstring& text) const
{
    std::vector<AnalyzerResult> results;
    if (text.empty())
        return results;

    const std::string tag(entityTypeTag(entity_type_));
    for (const auto& pattern : patterns_)
    {
        std::wsregex_iterator it(text.begin(), text.end(), pattern.regex);
        std::wsregex_iterator end;
        for (; it != end; ++it)
        {
            const auto& match = *it;
            if (match.length(0) <= 0)
                continue;

            auto start = static_cast<std::size_t>(match.position(0));
            auto length = static_cast<std::size_t>(match.length(0));
            if (!accept(std::wstring_view(text).substr(start, length)))
                continue;

            AnalyzerResult result;
            result.entity_type = tag;
            result.start = start;
            result.end = start + length;
            result.score = pattern.definition.score;
            result.pattern_name = pattern.definition.name;
            results.push_back(std::move(result));
        }
    }
    return results;
}

} // namespace detection
