#include "EntityType.hpp"

#include <array>
#include <utility>

namespace detection
{

namespace
{

constexpr std::array<std::pair<EntityType, std::string_view>, 21> kTags = { {
    { EntityType::Person, "PERSON" },
    { EntityType::Organization, "ORGANIZATION" },
    { EntityType::EmailAddress, "EMAIL_ADDRESS" },
    { EntityType::PhoneNumber, "PHONE_NUMBER" },
    { EntityType::CreditCard, "CREDIT_CARD" },
    { EntityType::IpAddress, "IP_ADDRESS" },
    { EntityType::Url, "URL" },
    { EntityType::ApiKey, "API_KEY" },
    { EntityType::ProjectName, "PROJECT_NAME" },
    { EntityType::Confidential, "CONFIDENTIAL" },
    { EntityType::JpPhoneNumber, "JP_PHONE_NUMBER" },
    { EntityType::JpPostalCode, "JP_POSTAL_CODE" },
    { EntityType::JpAddress, "JP_ADDRESS" },
    { EntityType::JpMyNumber, "JP_MY_NUMBER" },
    { EntityType::JpCurrency, "JP_CURRENCY" },
    { EntityType::JpCompany, "JP_COMPANY" },
    { EntityType::JpPersonName, "JP_PERSON_NAME" },
    { EntityType::DictCompanies, "DICT_COMPANIES" },
    { EntityType::DictProjects, "DICT_PROJECTS" },
    { EntityType::DictPersons, "DICT_PERSONS" },
    { EntityType::DictCustom, "DICT_CUSTOM" },
} };

constexpr std::string_view kLocalePrefix = "JP_";

} // namespace

std::string_view entityTypeTag(EntityType type)
{
    for (const auto& [value, tag] : kTags)
    {
        if (value == type)
            return tag;
    }
    return {};
}

EntityType entityTypeFromTag(std::string_view tag)
{
    for (const auto& [value, known] : kTags)
    {
        if (known == tag)
            return value;
    }
    if (tag.substr(0, kLocalePrefix.size()) == kLocalePrefix)
        return EntityType::JpOther;
    return EntityType::Other;
}

const char* sourceMethodName(SourceMethod method)
{
    switch (method)
    {
    case SourceMethod::Pattern:
        return "regex";
    case SourceMethod::Dictionary:
        return "dictionary";
    case SourceMethod::Context:
        return "llm";
    }
    return "unknown";
}

int priorityRank(EntityType type, SourceMethod method)
{
    if (method == SourceMethod::Dictionary)
        return 0;

    switch (type)
    {
    case EntityType::JpPhoneNumber:
    case EntityType::JpPostalCode:
    case EntityType::JpAddress:
    case EntityType::JpMyNumber:
    case EntityType::JpCurrency:
    case EntityType::JpCompany:
    case EntityType::JpPersonName:
    case EntityType::JpOther:
    case EntityType::EmailAddress:
    case EntityType::CreditCard:
    case EntityType::ApiKey:
        return 1;

    case EntityType::Person:
    case EntityType::Organization:
        return 3;

    case EntityType::PhoneNumber:
    case EntityType::IpAddress:
    case EntityType::Url:
    case EntityType::ProjectName:
    case EntityType::Confidential:
    case EntityType::DictCompanies:
    case EntityType::DictProjects:
    case EntityType::DictPersons:
    case EntityType::DictCustom:
    case EntityType::Other:
        return 2;
    }
    return 2;
}

} // namespace detection
