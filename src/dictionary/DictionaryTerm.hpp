#pragma once

#include <array>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace dictionary
{

// Fixed categories; anything else is treated as "custom" when matching.
inline constexpr std::array<std::string_view, 4> kCategories = { "companies", "projects", "persons", "custom" };
inline constexpr std::string_view kDefaultCategory = "custom";
inline constexpr std::string_view kDefaultLabel = "機密情報";

struct DictionaryTerm
{
    std::string value;    // literal to match, non-empty and unique
    std::string label;    // display label
    std::string category; // companies, projects, persons, custom
};

using TermList = std::vector<DictionaryTerm>;

bool isKnownCategory(std::string_view category);

// Read-only view of the registered terms. A snapshot stays valid and
// unchanged for as long as the caller holds it.
class ITermSource
{
public:
    virtual ~ITermSource() = default;
    virtual std::shared_ptr<const TermList> snapshot() const = 0;
};

// Fixed term list, for embedding and tests
class StaticTermSource : public ITermSource
{
public:
    StaticTermSource() : terms_(std::make_shared<const TermList>()) {}
    explicit StaticTermSource(TermList terms) : terms_(std::make_shared<const TermList>(std::move(terms))) {}

    std::shared_ptr<const TermList> snapshot() const override { return terms_; }

private:
    std::shared_ptr<const TermList> terms_;
};

} // namespace dictionary
