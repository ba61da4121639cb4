#pragma once

#include "DictionaryTerm.hpp"
#include "../detection/SpanCandidate.hpp"

#include <string>
#include <vector>

namespace dictionary
{

class DictionaryMatcher
{
public:
    static constexpr double kDictionaryScore = 0.95;

    /**
     * @brief Find every literal occurrence of every term.
     *
     * Case-sensitive, non-overlapping left-to-right search per term; term
     * characters are never interpreted as a pattern. Offsets are codepoints
     * into @p text.
     */
    static std::vector<detection::SpanCandidate> match(const std::wstring& text, const TermList& terms);

    /// "DICT_" + upper-cased category, e.g. "DICT_COMPANIES"
    static std::string entityTagFor(const std::string& category);

    static detection::EntityType entityTypeFor(const std::string& category);
};

} // namespace dictionary
