#include <catch2/catch_test_macros.hpp>
#include "detection/DetectionEngine.hpp"
#include "detection/PatternRecognizerSet.hpp"
#include "utils/ErrorReporter.hpp"
#include "../utils/test_doubles.hpp"

#include <cmath>
#include <limits>
#include <thread>

using namespace detection;
using test_utils::FixedPatternAnalyzer;
using test_utils::ScriptedContextClient;

namespace {

SpanCandidate makeCandidate(const std::string& tag, std::size_t start, std::size_t end, double score,
                            SourceMethod method = SourceMethod::Pattern) {
    SpanCandidate c;
    c.entity_type = entityTypeFromTag(tag);
    c.entity_tag = tag;
    c.start = start;
    c.end = end;
    c.score = score;
    c.source_method = method;
    return c;
}

AnalyzerResult makeResult(const std::string& tag, std::size_t start, std::size_t end, double score) {
    AnalyzerResult r;
    r.entity_type = tag;
    r.start = start;
    r.end = end;
    r.score = score;
    return r;
}

std::shared_ptr<const dictionary::ITermSource> terms(dictionary::TermList list = {}) {
    return std::make_shared<const dictionary::StaticTermSource>(std::move(list));
}

bool pairwiseDisjoint(const std::vector<SpanCandidate>& spans) {
    for (std::size_t i = 0; i < spans.size(); ++i) {
        for (std::size_t j = i + 1; j < spans.size(); ++j) {
            if (spans[i].overlaps(spans[j]))
                return false;
        }
    }
    return true;
}

// 60 codepoints, nothing a recognizer would flag
const std::string kLongPlainText = "lorem lorem lorem lorem lorem lorem lorem lorem lorem lorem ";

} // namespace

TEST_CASE("Engine masks detections from the built-in recognizers", "[engine]") {
    DetectionEngine engine(EngineConfig{}, PatternRecognizerSet::createDefault(), terms());

    auto result = engine.detect("田中様の電話は090-1234-5678です");
    REQUIRE(result.original_text == "田中様の電話は090-1234-5678です");
    REQUIRE(result.masked_text == "[個人名]の電話は[電話番号]です");
    REQUIRE(result.detections.size() == 2);
    REQUIRE(result.processing_time_ms >= 0.0);

    SECTION("Detections keep their original order") {
        REQUIRE(result.detections[0].entity_tag == "JP_PHONE_NUMBER");
        REQUIRE(result.detections[0].matched_text == "090-1234-5678");
        REQUIRE(result.detections[0].score == 0.85);
        REQUIRE(result.detections[1].entity_tag == "JP_PERSON_NAME");
        REQUIRE(result.detections[1].matched_text == "田中様");
    }

    SECTION("Masking is idempotent") {
        auto again = engine.detect(result.masked_text);
        REQUIRE(again.detections.empty());
        REQUIRE(again.masked_text == result.masked_text);
    }
}

TEST_CASE("Engine with empty input", "[engine]") {
    DetectionEngine engine(EngineConfig{}, PatternRecognizerSet::createDefault(), terms({ { "x", "y", "custom" } }));
    auto result = engine.detect("");
    REQUIRE(result.detections.empty());
    REQUIRE(result.masked_text.empty());
    REQUIRE(result.original_text.empty());
}

TEST_CASE("Engine combines dictionary and pattern candidates", "[engine]") {
    auto analyzer = std::make_shared<FixedPatternAnalyzer>(
        std::vector<AnalyzerResult>{ makeResult("PERSON", 0, 4, 0.99) });
    DetectionEngine engine(EngineConfig{}, analyzer, terms({ { "Acme", "取引先", "companies" } }));

    auto result = engine.detect("Acme is here");
    REQUIRE(result.detections.size() == 1);
    REQUIRE(result.detections[0].source_method == SourceMethod::Dictionary);
    REQUIRE(result.detections[0].label_hint == "取引先");
    REQUIRE(result.masked_text == "[会社名] is here");
}

TEST_CASE("Engine skips invalid analyzer spans", "[engine]") {
    utils::ErrorReporter::Clear();
    auto analyzer = std::make_shared<FixedPatternAnalyzer>(std::vector<AnalyzerResult>{
        makeResult("JP_MY_NUMBER", 5, 3, 0.7),
        makeResult("JP_MY_NUMBER", 3, 3, 0.7),
        makeResult("JP_MY_NUMBER", 0, 100, 0.7),
        makeResult("JP_MY_NUMBER", 0, 2, 1.5),
        makeResult("JP_MY_NUMBER", 0, 2, -0.1),
        makeResult("JP_MY_NUMBER", 0, 2, std::numeric_limits<double>::quiet_NaN()),
        makeResult("JP_BANK_ACCOUNT", 6, 9, 0.6),
    });
    DetectionEngine engine(EngineConfig{}, analyzer, terms());

    auto result = engine.detect("acct: 123");
    REQUIRE(result.detections.size() == 1);
    REQUIRE(result.detections[0].entity_tag == "JP_BANK_ACCOUNT");
    REQUIRE(result.detections[0].entity_type == EntityType::JpOther);
    REQUIRE(result.detections[0].matched_text == "123");
    REQUIRE(result.masked_text == "acct: [機密情報]");
    REQUIRE(utils::ErrorReporter::LastReport().category == utils::ErrorCategory::PatternAnalysis);
    utils::ErrorReporter::Clear();
}

TEST_CASE("Engine survives a throwing analyzer", "[engine]") {
    auto analyzer = std::make_shared<FixedPatternAnalyzer>();
    analyzer->throw_on_analyze = true;
    DetectionEngine engine(EngineConfig{}, analyzer, terms({ { "Acme", "x", "companies" } }));

    auto result = engine.detect("Acme");
    REQUIRE(result.detections.size() == 1);
    REQUIRE(result.masked_text == "[会社名]");
    utils::ErrorReporter::Clear();
}

TEST_CASE("Invalid UTF-8 bytes survive masking as replacement characters", "[engine][utf8]") {
    utils::ErrorReporter::Clear();
    DetectionEngine engine(EngineConfig{}, std::make_shared<FixedPatternAnalyzer>(),
                           terms({ { "Acme", "x", "companies" } }));

    auto result = engine.detect("Acme \xff\xfe end");
    REQUIRE(result.detections.size() == 1);
    REQUIRE(result.detections[0].start == 0);
    REQUIRE(result.masked_text == "[会社名] \xEF\xBF\xBD\xEF\xBF\xBD end");
    REQUIRE(result.original_text == "Acme \xff\xfe end");
    REQUIRE(utils::ErrorReporter::HasPending());
    REQUIRE(utils::ErrorReporter::LastReport().category == utils::ErrorCategory::PatternAnalysis);
    utils::ErrorReporter::Clear();

    SECTION("Offsets after the bad bytes still line up") {
        auto later = engine.detect("\xff Acme");
        REQUIRE(later.detections.size() == 1);
        REQUIRE(later.detections[0].start == 2);
        REQUIRE(later.masked_text == "\xEF\xBF\xBD [会社名]");
        utils::ErrorReporter::Clear();
    }
}

TEST_CASE("Context stage gating", "[engine][context]") {
    auto client = std::make_shared<ScriptedContextClient>();
    client->findings = { { "個人名", "lorem" } };
    auto detector = std::make_shared<const context::ContextDetector>(client);

    EngineConfig cfg;
    cfg.use_context = true;
    auto analyzer = std::make_shared<FixedPatternAnalyzer>();

    SECTION("Runs when nothing else was found and the text is long enough") {
        DetectionEngine engine(cfg, analyzer, terms(), detector);
        auto result = engine.detect(kLongPlainText);
        REQUIRE(client->analyze_calls.load() == 1);
        REQUIRE(result.detections.size() == 1);
        REQUIRE(result.detections[0].source_method == SourceMethod::Context);
        REQUIRE(result.detections[0].start == 0);
        REQUIRE(result.masked_text.rfind("[個人名] lorem", 0) == 0);
    }

    SECTION("Skipped when an earlier stage found a candidate") {
        DetectionEngine engine(cfg, analyzer, terms({ { "lorem", "x", "custom" } }), detector);
        auto result = engine.detect(kLongPlainText);
        REQUIRE(client->probe_calls.load() == 0);
        REQUIRE(client->analyze_calls.load() == 0);
        REQUIRE(result.detections.size() == 10);
    }

    SECTION("Skipped for short text") {
        DetectionEngine engine(cfg, analyzer, terms(), detector);
        auto result = engine.detect("lorem ipsum");
        REQUIRE(client->analyze_calls.load() == 0);
        REQUIRE(result.masked_text == "lorem ipsum");
    }

    SECTION("Threshold is configurable") {
        cfg.min_text_length_for_context = 5;
        DetectionEngine engine(cfg, analyzer, terms(), detector);
        engine.detect("lorem ipsum");
        REQUIRE(client->analyze_calls.load() == 1);
    }

    SECTION("Skipped when disabled") {
        cfg.use_context = false;
        DetectionEngine engine(cfg, analyzer, terms(), detector);
        engine.detect(kLongPlainText);
        REQUIRE(client->probe_calls.load() == 0);
        REQUIRE(client->analyze_calls.load() == 0);
    }

    SECTION("Unavailable context degrades to no results") {
        client->available = false;
        DetectionEngine engine(cfg, analyzer, terms(), detector);
        auto result = engine.detect(kLongPlainText);
        REQUIRE(result.detections.empty());
        REQUIRE(result.masked_text == kLongPlainText);
        REQUIRE_FALSE(engine.isContextAvailable());
        utils::ErrorReporter::Clear();
    }
}

TEST_CASE("Engine reconfiguration returns a new engine", "[engine]") {
    auto client = std::make_shared<ScriptedContextClient>();
    auto detector = std::make_shared<const context::ContextDetector>(client);
    DetectionEngine engine(EngineConfig{}, std::make_shared<FixedPatternAnalyzer>(), terms(), detector);

    EngineConfig cfg;
    cfg.use_context = true;
    cfg.min_text_length_for_context = 10;
    auto reconfigured = engine.withConfig(cfg);

    REQUIRE_FALSE(engine.config().use_context);
    REQUIRE(engine.config().min_text_length_for_context == 50);
    REQUIRE(reconfigured.config().use_context);
    REQUIRE(reconfigured.config().min_text_length_for_context == 10);
    REQUIRE(reconfigured.isContextAvailable());

    SECTION("Engine without a context detector reports it unavailable") {
        DetectionEngine bare(EngineConfig{}, std::make_shared<FixedPatternAnalyzer>(), terms());
        REQUIRE_FALSE(bare.isContextAvailable());
    }
}

TEST_CASE("Resolve applies the priority policy", "[engine][resolve]") {
    SECTION("Dictionary candidate beats an overlapping generic person") {
        std::vector<SpanCandidate> input{
            makeCandidate("PERSON", 0, 4, 0.99, SourceMethod::Context),
            makeCandidate("DICT_PERSONS", 0, 4, 0.95, SourceMethod::Dictionary),
        };
        auto resolved = DetectionEngine::resolve(input);
        REQUIRE(resolved.size() == 1);
        REQUIRE(resolved[0].source_method == SourceMethod::Dictionary);
    }

    SECTION("Longer span wins within a rank regardless of score") {
        std::vector<SpanCandidate> input{
            makeCandidate("JP_POSTAL_CODE", 2, 6, 0.99),
            makeCandidate("JP_PHONE_NUMBER", 0, 10, 0.5),
        };
        auto resolved = DetectionEngine::resolve(input);
        REQUIRE(resolved.size() == 1);
        REQUIRE(resolved[0].entity_tag == "JP_PHONE_NUMBER");
    }

    SECTION("Higher score wins for equal rank and length") {
        std::vector<SpanCandidate> input{
            makeCandidate("JP_PHONE_NUMBER", 0, 10, 0.7),
            makeCandidate("JP_PHONE_NUMBER", 0, 10, 0.85),
        };
        auto resolved = DetectionEngine::resolve(input);
        REQUIRE(resolved.size() == 1);
        REQUIRE(resolved[0].score == 0.85);
    }

    SECTION("Full ties keep the first candidate") {
        auto first = makeCandidate("URL", 0, 5, 0.6);
        first.matched_text = "first";
        auto second = makeCandidate("URL", 0, 5, 0.6);
        second.matched_text = "second";
        auto resolved = DetectionEngine::resolve({ first, second });
        REQUIRE(resolved.size() == 1);
        REQUIRE(resolved[0].matched_text == "first");
    }

    SECTION("Precise types beat broad ones even when shorter") {
        std::vector<SpanCandidate> input{
            makeCandidate("ORGANIZATION", 0, 20, 0.9, SourceMethod::Context),
            makeCandidate("EMAIL_ADDRESS", 5, 15, 0.5),
        };
        auto resolved = DetectionEngine::resolve(input);
        REQUIRE(resolved.size() == 1);
        REQUIRE(resolved[0].entity_tag == "EMAIL_ADDRESS");
    }

    SECTION("Adjacent spans do not overlap") {
        std::vector<SpanCandidate> input{
            makeCandidate("URL", 0, 5, 0.6),
            makeCandidate("URL", 5, 10, 0.6),
        };
        REQUIRE(DetectionEngine::resolve(input).size() == 2);
    }

    SECTION("Output is always overlap-free") {
        std::vector<SpanCandidate> input;
        const char* tags[] = { "PERSON", "JP_COMPANY", "URL", "DICT_CUSTOM", "JP_ADDRESS" };
        for (std::size_t i = 0; i < 40; ++i) {
            const std::size_t start = (i * 7) % 50;
            const std::size_t length = 1 + (i * 3) % 9;
            const auto method = i % 5 == 3 ? SourceMethod::Dictionary : SourceMethod::Pattern;
            input.push_back(makeCandidate(tags[i % 5], start, start + length, 0.1 + 0.02 * i, method));
        }
        auto resolved = DetectionEngine::resolve(input);
        REQUIRE_FALSE(resolved.empty());
        REQUIRE(pairwiseDisjoint(resolved));
    }

    SECTION("Empty input") {
        REQUIRE(DetectionEngine::resolve({}).empty());
    }
}

TEST_CASE("Mask replaces spans right to left", "[engine][mask]") {
    EntityLabelTable labels({ { "ID", "ID" }, { "L1", "L1" }, { "L2", "L2" } });

    SECTION("Single span inside the text") {
        REQUIRE(DetectionEngine::mask("A12345B", { makeCandidate("ID", 1, 6, 1.0) }, labels) == "A[ID]B");
    }

    SECTION("Spans at both ends") {
        std::vector<SpanCandidate> spans{ makeCandidate("L1", 0, 1, 1.0), makeCandidate("L2", 4, 5, 1.0) };
        REQUIRE(DetectionEngine::mask("X Y Z", spans, labels) == "[L1] Y [L2]");
    }

    SECTION("Order of the input does not matter") {
        std::vector<SpanCandidate> spans{ makeCandidate("L2", 4, 5, 1.0), makeCandidate("L1", 0, 1, 1.0) };
        REQUIRE(DetectionEngine::mask("X Y Z", spans, labels) == "[L1] Y [L2]");
    }

    SECTION("Offsets are codepoints") {
        REQUIRE(DetectionEngine::mask("田中様です", { makeCandidate("JP_PERSON_NAME", 0, 3, 0.6) }, labels) ==
                "[個人名]です");
    }

    SECTION("Unknown tags use the fallback label") {
        REQUIRE(DetectionEngine::mask("abc", { makeCandidate("SOMETHING", 0, 3, 0.5) }, labels) == "[機密情報]");
    }

    SECTION("No spans leaves the text unchanged") {
        REQUIRE(DetectionEngine::mask("unchanged", {}, labels) == "unchanged");
    }
}

TEST_CASE("Engine applies label overrides", "[engine][labels]") {
    auto labels = std::make_shared<const EntityLabelTable>(std::map<std::string, std::string>{ { "URL", "リンク" } });
    DetectionEngine engine(EngineConfig{}, PatternRecognizerSet::createDefault(), terms(), nullptr, labels);

    auto result = engine.detect("see https://example.com now");
    REQUIRE(result.masked_text == "see [リンク] now");
    REQUIRE(engine.labels().labelForTag("URL") == "リンク");
}

TEST_CASE("Engine detect is safe to call concurrently", "[engine][concurrency]") {
    DetectionEngine engine(EngineConfig{}, PatternRecognizerSet::createDefault(),
                           terms({ { "Acme", "取引先", "companies" } }));
    const std::string text = "Acme、田中様、090-1234-5678";
    const std::string expected = engine.detect(text).masked_text;

    std::vector<std::string> outputs(4);
    std::vector<std::thread> threads;
    for (std::size_t i = 0; i < outputs.size(); ++i) {
        threads.emplace_back([&, i]() {
            for (int n = 0; n < 20; ++n)
                outputs[i] = engine.detect(text).masked_text;
        });
    }
    for (auto& t : threads)
        t.join();

    for (const auto& out : outputs)
        REQUIRE(out == expected);
    REQUIRE(expected == "[会社名]、[個人名]、[電話番号]");
}
