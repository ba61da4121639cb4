#pragma once

#include <string>
#include <string_view>

namespace detection
{

// Where a span candidate came from. Only used for priority resolution.
enum class SourceMethod
{
    Pattern,
    Dictionary,
    Context
};

// Closed set of entity types the pipeline can produce. Tags reported by an
// external analyzer that are not listed here map to JpOther (JP_ locale
// prefix) or Other.
enum class EntityType
{
    // Generic types
    Person,
    Organization,
    EmailAddress,
    PhoneNumber,
    CreditCard,
    IpAddress,
    Url,
    ApiKey,
    ProjectName,
    Confidential,

    // Japanese locale types
    JpPhoneNumber,
    JpPostalCode,
    JpAddress,
    JpMyNumber,
    JpCurrency,
    JpCompany,
    JpPersonName,
    JpOther,

    // Dictionary categories
    DictCompanies,
    DictProjects,
    DictPersons,
    DictCustom,

    Other
};

/// Canonical tag, e.g. "JP_PHONE_NUMBER". JpOther and Other have no canonical tag.
std::string_view entityTypeTag(EntityType type);

/// Parse a tag; unknown tags become JpOther or Other
EntityType entityTypeFromTag(std::string_view tag);

const char* sourceMethodName(SourceMethod method);

/**
 * @brief Priority class used by overlap resolution, lower wins.
 *
 * 0 dictionary source, 1 precise locale/identifier types, 3 broad generic
 * person/organization, 2 everything else.
 */
int priorityRank(EntityType type, SourceMethod method);

} // namespace detection
