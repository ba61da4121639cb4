#include "EntityLabelTable.hpp"

#include <array>
#include <utility>

namespace detection
{

namespace
{

constexpr std::array<std::pair<std::string_view, std::string_view>, 21> kDefaultLabels = { {
    { "PERSON", "個人名" },
    { "ORGANIZATION", "会社名" },
    { "EMAIL_ADDRESS", "メールアドレス" },
    { "PHONE_NUMBER", "電話番号" },
    { "JP_PHONE_NUMBER", "電話番号" },
    { "CREDIT_CARD", "クレジットカード" },
    { "JP_POSTAL_CODE", "郵便番号" },
    { "JP_ADDRESS", "住所" },
    { "JP_MY_NUMBER", "マイナンバー" },
    { "JP_CURRENCY", "金額" },
    { "JP_COMPANY", "会社名" },
    { "JP_PERSON_NAME", "個人名" },
    { "API_KEY", "APIキー" },
    { "IP_ADDRESS", "IPアドレス" },
    { "URL", "URL" },
    { "PROJECT_NAME", "プロジェクト名" },
    { "CONFIDENTIAL", "機密情報" },
    { "DICT_COMPANIES", "会社名" },
    { "DICT_PROJECTS", "プロジェクト名" },
    { "DICT_PERSONS", "個人名" },
    { "DICT_CUSTOM", "機密情報" },
} };

} // namespace

EntityLabelTable::EntityLabelTable()
    : fallback_(kFallbackLabel)
{
    labels_.reserve(kDefaultLabels.size());
    for (const auto& [tag, label] : kDefaultLabels)
    {
        labels_.emplace(std::string(tag), std::string(label));
    }
}

EntityLabelTable::EntityLabelTable(const std::map<std::string, std::string>& overrides)
    : EntityLabelTable()
{
    for (const auto& [tag, label] : overrides)
    {
        if (tag.empty() || label.empty())
            continue;
        labels_.insert_or_assign(tag, label);
    }
}

const std::string& EntityLabelTable::labelForTag(std::string_view tag) const
{
    auto it = labels_.find(std::string(tag));
    if (it == labels_.end())
        return fallback_;
    return it->second;
}

const std::string& EntityLabelTable::labelFor(const SpanCandidate& candidate) const
{
    return labelForTag(candidate.entity_tag);
}

bool EntityLabelTable::contains(std::string_view tag) const
{
    return labels_.find(std::string(tag)) != labels_.end();
}

} // namespace detection
