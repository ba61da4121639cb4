#include "DictionaryMatcher.hpp"
#include "../detection/TextUtils.hpp"

#include <algorithm>
#include <cctype>

namespace dictionary
{

bool isKnownCategory(std::string_view category)
{
    return std::find(kCategories.begin(), kCategories.end(), category) != kCategories.end();
}

std::string DictionaryMatcher::entityTagFor(const std::string& category)
{
    std::string tag = "DICT_";
    tag.reserve(tag.size() + category.size());
    for (unsigned char c : category)
        tag.push_back(static_cast<char>(std::toupper(c)));
    return tag;
}

detection::EntityType DictionaryMatcher::entityTypeFor(const std::string& category)
{
    if (category == "companies")
        return detection::EntityType::DictCompanies;
    if (category == "projects")
        return detection::EntityType::DictProjects;
    if (category == "persons")
        return detection::EntityType::DictPersons;
    return detection::EntityType::DictCustom;
}

std::vector<detection::SpanCandidate> DictionaryMatcher::match(const std::wstring& text, const TermList& terms)
{
    std::vector<detection::SpanCandidate> candidates;
    if (text.empty() || terms.empty())
        return candidates;

    for (const auto& term : terms)
    {
        if (term.value.empty())
            continue;

        const std::wstring needle = detection::utf8ToWide(term.value);
        if (needle.empty())
            continue;

        const auto entity_type = entityTypeFor(term.category);
        const auto entity_tag = entityTagFor(term.category);
        const std::string matched = detection::wideToUtf8(needle);

        std::size_t pos = text.find(needle);
        while (pos != std::wstring::npos)
        {
            detection::SpanCandidate candidate;
            candidate.entity_type = entity_type;
            candidate.entity_tag = entity_tag;
            candidate.matched_text = matched;
            candidate.start = pos;
            candidate.end = pos + needle.size();
            candidate.score = kDictionaryScore;
            candidate.source_method = detection::SourceMethod::Dictionary;
            candidate.label_hint = term.label;
            candidates.push_back(std::move(candidate));

            pos = text.find(needle, pos + needle.size());
        }
    }
    return candidates;
}

} // namespace dictionary
