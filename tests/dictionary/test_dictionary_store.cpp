#include <catch2/catch_test_macros.hpp>
#include "dictionary/DictionaryStore.hpp"
#include "../utils/test_doubles.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>

using namespace dictionary;
using test_utils::TempDir;

namespace {

const DictionaryTerm* findTerm(const TermList& terms, const std::string& value) {
    for (const auto& t : terms) {
        if (t.value == value)
            return &t;
    }
    return nullptr;
}

} // namespace

TEST_CASE("DictionaryStore load", "[dictionary][store]") {
    TempDir dir;

    SECTION("Missing file yields an empty store") {
        DictionaryStore store(dir.str());
        REQUIRE(store.load());
        REQUIRE(store.size() == 0);
        REQUIRE(store.snapshot()->empty());
    }

    SECTION("Grouped entries are read with defaults") {
        dir.writeFile("custom.json", R"({
            "version": "1.0",
            "updated_at": "2024-01-01T00:00:00",
            "entries": {
                "companies": [{"value": "Acme", "label": "取引先"}],
                "persons": [{"value": "山田太郎"}],
                "vendors": [{"value": "Globex", "label": "仕入先"}],
                "custom": [{"label": "no value"}, {"value": ""}]
            }
        })");

        DictionaryStore store(dir.str());
        REQUIRE(store.load());
        REQUIRE(store.size() == 3);
        REQUIRE(store.updatedAt() == "2024-01-01T00:00:00");

        auto terms = store.snapshot();
        const auto* acme = findTerm(*terms, "Acme");
        REQUIRE(acme != nullptr);
        REQUIRE(acme->label == "取引先");
        REQUIRE(acme->category == "companies");

        const auto* person = findTerm(*terms, "山田太郎");
        REQUIRE(person != nullptr);
        REQUIRE(person->label == "機密情報");
        REQUIRE(person->category == "persons");

        const auto* vendor = findTerm(*terms, "Globex");
        REQUIRE(vendor != nullptr);
        REQUIRE(vendor->category == "vendors");
    }

    SECTION("Malformed file is reported and yields an empty store") {
        dir.writeFile("custom.json", "{ this is not json");
        DictionaryStore store(dir.str());
        REQUIRE_FALSE(store.load());
        REQUIRE(store.size() == 0);
        REQUIRE_FALSE(store.lastError().empty());
    }
}

TEST_CASE("DictionaryStore add and remove", "[dictionary][store]") {
    TempDir dir;
    DictionaryStore store(dir.str());
    REQUIRE(store.load());

    REQUIRE(store.addTerm("Acme", "取引先", "companies"));
    REQUIRE(store.size() == 1);
    REQUIRE_FALSE(store.updatedAt().empty());
    REQUIRE(std::filesystem::exists(store.filePath()));

    SECTION("Duplicate and empty values are rejected") {
        REQUIRE_FALSE(store.addTerm("Acme", "other", "custom"));
        REQUIRE_FALSE(store.addTerm("", "x", "custom"));
        REQUIRE(store.size() == 1);
    }

    SECTION("Changes persist across instances") {
        DictionaryStore reopened(dir.str());
        REQUIRE(reopened.load());
        REQUIRE(reopened.size() == 1);
        const auto* acme = findTerm(*reopened.snapshot(), "Acme");
        REQUIRE(acme != nullptr);
        REQUIRE(acme->label == "取引先");
        REQUIRE(acme->category == "companies");
    }

    SECTION("Saved file uses the grouped layout") {
        REQUIRE(store.addTerm("Globex", "仕入先", "vendors"));
        auto j = nlohmann::json::parse(dir.readFile("custom.json"));
        REQUIRE(j["version"] == "1.0");
        REQUIRE(j["entries"]["companies"].size() == 1);
        REQUIRE(j["entries"]["companies"][0]["value"] == "Acme");
        REQUIRE(j["entries"]["projects"].empty());
        REQUIRE(j["entries"]["persons"].empty());
        REQUIRE(j["entries"]["custom"].size() == 1);
        REQUIRE(j["entries"]["custom"][0]["value"] == "Globex");
    }

    SECTION("Remove") {
        REQUIRE(store.removeTerm("Acme"));
        REQUIRE(store.size() == 0);
        REQUIRE_FALSE(store.removeTerm("Acme"));

        DictionaryStore reopened(dir.str());
        REQUIRE(reopened.load());
        REQUIRE(reopened.size() == 0);
    }
}

TEST_CASE("DictionaryStore snapshots are isolated from later changes", "[dictionary][store]") {
    TempDir dir;
    DictionaryStore store(dir.str());
    REQUIRE(store.load());
    REQUIRE(store.addTerm("Acme", "取引先", "companies"));

    auto before = store.snapshot();
    REQUIRE(store.addTerm("Globex", "仕入先", "companies"));
    REQUIRE(store.removeTerm("Acme"));

    REQUIRE(before->size() == 1);
    REQUIRE(before->front().value == "Acme");

    auto after = store.snapshot();
    REQUIRE(after->size() == 1);
    REQUIRE(after->front().value == "Globex");
}

TEST_CASE("DictionaryStore CSV import", "[dictionary][store][csv]") {
    TempDir dir;
    DictionaryStore store(dir.str());
    REQUIRE(store.load());
    REQUIRE(store.addTerm("既存", "x", "custom"));

    const std::string csv = "種別,値,ラベル\n"
                            "会社名,株式会社サンプル,取引先\n"
                            "プロジェクト,Project Phoenix\n"
                            "人名, 山田太郎 ,担当者\n"
                            "その他,社外秘コード\n"
                            "謎の種別,なにか\n"
                            "会社名\n"
                            "会社名,,空\n"
                            "会社名,既存\n"
                            "企業,\"Foo, Inc.\",取引先\n";

    REQUIRE(store.importCsv(csv) == 6);
    REQUIRE(store.size() == 7);

    auto terms = store.snapshot();

    const auto* company = findTerm(*terms, "株式会社サンプル");
    REQUIRE(company != nullptr);
    REQUIRE(company->category == "companies");
    REQUIRE(company->label == "取引先");

    SECTION("Label defaults to the category column") {
        const auto* project = findTerm(*terms, "Project Phoenix");
        REQUIRE(project != nullptr);
        REQUIRE(project->category == "projects");
        REQUIRE(project->label == "プロジェクト");
    }

    SECTION("Fields are trimmed") {
        const auto* person = findTerm(*terms, "山田太郎");
        REQUIRE(person != nullptr);
        REQUIRE(person->category == "persons");
        REQUIRE(person->label == "担当者");
    }

    SECTION("Unknown categories map to custom") {
        REQUIRE(findTerm(*terms, "社外秘コード")->category == "custom");
        REQUIRE(findTerm(*terms, "なにか")->category == "custom");
    }

    SECTION("Quoted fields keep embedded commas") {
        const auto* quoted = findTerm(*terms, "Foo, Inc.");
        REQUIRE(quoted != nullptr);
        REQUIRE(quoted->category == "companies");
    }

    SECTION("Import is persisted") {
        DictionaryStore reopened(dir.str());
        REQUIRE(reopened.load());
        REQUIRE(reopened.size() == 7);
    }

    SECTION("Importing the same rows again adds nothing") {
        REQUIRE(store.importCsv(csv) == 0);
        REQUIRE(store.size() == 7);
    }
}

TEST_CASE("DictionaryStore CSV category mapping", "[dictionary][store][csv]") {
    REQUIRE(DictionaryStore::mapCsvCategory("会社名") == "companies");
    REQUIRE(DictionaryStore::mapCsvCategory("会社") == "companies");
    REQUIRE(DictionaryStore::mapCsvCategory("企業") == "companies");
    REQUIRE(DictionaryStore::mapCsvCategory("プロジェクト") == "projects");
    REQUIRE(DictionaryStore::mapCsvCategory("案件") == "projects");
    REQUIRE(DictionaryStore::mapCsvCategory("個人名") == "persons");
    REQUIRE(DictionaryStore::mapCsvCategory("人名") == "persons");
    REQUIRE(DictionaryStore::mapCsvCategory("その他") == "custom");
    REQUIRE(DictionaryStore::mapCsvCategory("カスタム") == "custom");
    REQUIRE(DictionaryStore::mapCsvCategory("unknown") == "custom");
}
