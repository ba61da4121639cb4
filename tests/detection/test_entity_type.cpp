#include <catch2/catch_test_macros.hpp>
#include "detection/EntityType.hpp"

using namespace detection;

TEST_CASE("Entity tags map to enumerators and back", "[entity_type]") {
    REQUIRE(entityTypeTag(EntityType::JpPhoneNumber) == "JP_PHONE_NUMBER");
    REQUIRE(entityTypeTag(EntityType::DictCompanies) == "DICT_COMPANIES");
    REQUIRE(entityTypeTag(EntityType::Person) == "PERSON");

    REQUIRE(entityTypeFromTag("JP_MY_NUMBER") == EntityType::JpMyNumber);
    REQUIRE(entityTypeFromTag("API_KEY") == EntityType::ApiKey);
    REQUIRE(entityTypeFromTag("DICT_CUSTOM") == EntityType::DictCustom);

    SECTION("Unknown tags keep their locale class") {
        REQUIRE(entityTypeFromTag("JP_BANK_ACCOUNT") == EntityType::JpOther);
        REQUIRE(entityTypeFromTag("US_SSN") == EntityType::Other);
        REQUIRE(entityTypeFromTag("") == EntityType::Other);
    }

    SECTION("Catch-all enumerators have no canonical tag") {
        REQUIRE(entityTypeTag(EntityType::JpOther).empty());
        REQUIRE(entityTypeTag(EntityType::Other).empty());
    }
}

TEST_CASE("Priority rank orders sources and types", "[entity_type][rank]") {
    SECTION("Dictionary source always ranks first") {
        REQUIRE(priorityRank(EntityType::DictPersons, SourceMethod::Dictionary) == 0);
        REQUIRE(priorityRank(EntityType::DictCustom, SourceMethod::Dictionary) == 0);
    }

    SECTION("Precise types") {
        REQUIRE(priorityRank(EntityType::JpPhoneNumber, SourceMethod::Pattern) == 1);
        REQUIRE(priorityRank(EntityType::JpOther, SourceMethod::Pattern) == 1);
        REQUIRE(priorityRank(EntityType::EmailAddress, SourceMethod::Pattern) == 1);
        REQUIRE(priorityRank(EntityType::CreditCard, SourceMethod::Pattern) == 1);
        REQUIRE(priorityRank(EntityType::ApiKey, SourceMethod::Pattern) == 1);
    }

    SECTION("Broad person and organization rank last") {
        REQUIRE(priorityRank(EntityType::Person, SourceMethod::Context) == 3);
        REQUIRE(priorityRank(EntityType::Organization, SourceMethod::Pattern) == 3);
    }

    SECTION("Everything else sits in between") {
        REQUIRE(priorityRank(EntityType::Url, SourceMethod::Pattern) == 2);
        REQUIRE(priorityRank(EntityType::IpAddress, SourceMethod::Pattern) == 2);
        REQUIRE(priorityRank(EntityType::ProjectName, SourceMethod::Context) == 2);
        REQUIRE(priorityRank(EntityType::Confidential, SourceMethod::Context) == 2);
        REQUIRE(priorityRank(EntityType::Other, SourceMethod::Pattern) == 2);
    }
}

TEST_CASE("Source method names match the report format", "[entity_type]") {
    REQUIRE(std::string(sourceMethodName(SourceMethod::Pattern)) == "regex");
    REQUIRE(std::string(sourceMethodName(SourceMethod::Dictionary)) == "dictionary");
    REQUIRE(std::string(sourceMethodName(SourceMethod::Context)) == "llm");
}
