#include <catch2/catch_test_macros.hpp>
#include "config/AppSettings.hpp"
#include "config/ConfigManager.hpp"
#include "utils/ErrorReporter.hpp"
#include "../utils/test_doubles.hpp"

using namespace config;
using test_utils::TempDir;

TEST_CASE("Settings keep defaults without a config file", "[config]") {
    TempDir dir;
    ConfigManager manager((dir.path() / "missing.toml").string());
    AppSettings settings;
    registerSettings(manager, settings);

    REQUIRE(manager.load());
    REQUIRE(std::string(manager.lastError()).empty());
    REQUIRE_FALSE(settings.engine.use_context);
    REQUIRE(settings.engine.min_text_length_for_context == 50);
    REQUIRE(settings.context.base_url == "http://localhost:11434");
    REQUIRE(settings.context.model == "gemma2:9b");
    REQUIRE(settings.dictionary_dir == "dictionaries");
    REQUIRE(settings.logging.level == 4);
    REQUIRE(settings.logging.file == "logs/shieldai.log");
    REQUIRE(settings.label_overrides.empty());
}

TEST_CASE("Settings are read from every section", "[config]") {
    ConfigManager manager;
    AppSettings settings;
    registerSettings(manager, settings);

    REQUIRE(manager.loadFromString(R"(
[engine]
use_context = true
min_text_length_for_context = 120

[context]
base_url = "http://ollama.internal:11434"
model = "qwen2:7b"
connect_timeout_ms = 500
timeout_ms = 0

[dictionary]
directory = "/var/lib/shieldai"

[logging]
level = 5
file = "out/app.log"
console = true
verbose = true

[labels]
URL = "リンク"
JP_COMPANY = "取引先"
)"));

    REQUIRE(settings.engine.use_context);
    REQUIRE(settings.engine.min_text_length_for_context == 120);
    REQUIRE(settings.context.base_url == "http://ollama.internal:11434");
    REQUIRE(settings.context.model == "qwen2:7b");
    REQUIRE(settings.context.connect_timeout_ms == 500);
    REQUIRE(settings.context.timeout_ms == 1);
    REQUIRE(settings.dictionary_dir == "/var/lib/shieldai");
    REQUIRE(settings.logging.level == 5);
    REQUIRE(settings.logging.file == "out/app.log");
    REQUIRE(settings.logging.console);
    REQUIRE(settings.logging.verbose);
    REQUIRE(settings.label_overrides.size() == 2);
    REQUIRE(settings.label_overrides.at("URL") == "リンク");
    REQUIRE(settings.label_overrides.at("JP_COMPANY") == "取引先");
}

TEST_CASE("Out of range values are ignored or clamped", "[config]") {
    ConfigManager manager;
    AppSettings settings;
    registerSettings(manager, settings);

    REQUIRE(manager.loadFromString(R"(
[engine]
min_text_length_for_context = -3

[logging]
level = 42

[labels]
URL = 7
EMAIL_ADDRESS = "メール"
)"));

    REQUIRE(settings.engine.min_text_length_for_context == 50);
    REQUIRE(settings.logging.level == 6);
    REQUIRE(settings.label_overrides.size() == 1);
    REQUIRE(settings.label_overrides.count("URL") == 0);
}

TEST_CASE("Malformed config is reported and keeps defaults", "[config]") {
    utils::ErrorReporter::Clear();
    ConfigManager manager;
    AppSettings settings;
    registerSettings(manager, settings);

    REQUIRE_FALSE(manager.loadFromString("[engine\nuse_context = true"));
    REQUIRE_FALSE(std::string(manager.lastError()).empty());
    REQUIRE_FALSE(settings.engine.use_context);
    REQUIRE(manager.root().empty());
    REQUIRE(utils::ErrorReporter::HasPending());
    REQUIRE(utils::ErrorReporter::LastReport().category == utils::ErrorCategory::Configuration);
    utils::ErrorReporter::Clear();
}

TEST_CASE("Config file on disk is loaded", "[config]") {
    TempDir dir;
    dir.writeFile("config.toml", "[engine]\nuse_context = true\n");
    ConfigManager manager((dir.path() / "config.toml").string());
    AppSettings settings;
    registerSettings(manager, settings);

    REQUIRE(manager.load());
    REQUIRE(settings.engine.use_context);
    REQUIRE(manager.root().contains("engine"));
}

TEST_CASE("Duplicate table handlers are rejected", "[config]") {
    ConfigManager manager;
    int calls = 0;
    REQUIRE(manager.registerTable("engine", { [&calls](const toml::table&) { ++calls; } }));
    REQUIRE_FALSE(manager.registerTable("engine", { [&calls](const toml::table&) { calls += 10; } }));

    SECTION("Absent sections still reach their handler") {
        REQUIRE(manager.loadFromString("[other]\nx = 1\n"));
        REQUIRE(calls == 1);
    }
}
