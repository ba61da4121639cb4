#include "DetectionEngine.hpp"
#include "Diagnostics.hpp"
#include "StageRunner.hpp"
#include "TextUtils.hpp"
#include "../dictionary/DictionaryMatcher.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/Profile.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <numeric>
#include <utility>

namespace detection
{

namespace
{

using CandidateList = std::vector<SpanCandidate>;

bool isValidScore(double score) { return !std::isnan(score) && score >= 0.0 && score <= 1.0; }

void append(CandidateList& into, CandidateList&& from)
{
    into.insert(into.end(), std::make_move_iterator(from.begin()), std::make_move_iterator(from.end()));
}

} // namespace

DetectionEngine::DetectionEngine(EngineConfig config, std::shared_ptr<const IPatternAnalyzer> analyzer,
                                 std::shared_ptr<const dictionary::ITermSource> terms,
                                 std::shared_ptr<const context::ContextDetector> context,
                                 std::shared_ptr<const EntityLabelTable> labels)
    : config_(config)
    , analyzer_(std::move(analyzer))
    , terms_(std::move(terms))
    , context_(std::move(context))
    , labels_(labels ? std::move(labels) : std::make_shared<const EntityLabelTable>())
{
}

DetectionEngine DetectionEngine::withConfig(const EngineConfig& config) const
{
    return DetectionEngine(config, analyzer_, terms_, context_, labels_);
}

bool DetectionEngine::isContextAvailable() const { return context_ && context_->isAvailable(); }

DetectionResult DetectionEngine::detect(const std::string& text) const
{
    PROFILE_SCOPE_FUNCTION();
    const auto started = std::chrono::steady_clock::now();

    DetectionResult result;
    result.original_text = text;
    result.masked_text = text;

    std::size_t replaced = 0;
    const std::wstring wide = utf8ToWide(text, &replaced);
    if (replaced > 0)
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::PatternAnalysis, "Input is not valid UTF-8",
                                            std::to_string(replaced) + " bytes replaced with U+FFFD");
    }
    if (!wide.empty())
    {
        CandidateList all;

        auto pattern = run_stage<CandidateList>("pattern", [&]() { return runPatternStage(wide); });
        PLOG_DEBUG_(Diagnostics::kLogInstance) << "[Engine] pattern stage: " << pattern.result.size()
                                               << " candidates";
        append(all, std::move(pattern.result));

        auto dictionary = run_stage<CandidateList>("dictionary", [&]() { return runDictionaryStage(wide); });
        PLOG_DEBUG_(Diagnostics::kLogInstance) << "[Engine] dictionary stage: " << dictionary.result.size()
                                               << " candidates";
        append(all, std::move(dictionary.result));

        if (shouldRunContext(all.size(), wide.size()))
        {
            auto ctx = run_stage<CandidateList>("context", [&]() { return runContextStage(wide); });
            PLOG_DEBUG_(Diagnostics::kLogInstance) << "[Engine] context stage: " << ctx.result.size()
                                                   << " candidates";
            append(all, std::move(ctx.result));
        }

        // Report survivors in the order the detectors produced them
        auto kept = resolveIndices(all);
        std::sort(kept.begin(), kept.end());
        result.detections.reserve(kept.size());
        for (auto index : kept)
            result.detections.push_back(all[index]);

        if (!result.detections.empty())
            result.masked_text = wideToUtf8(maskWide(wide, result.detections, *labels_));

        if (Diagnostics::IsVerbose())
        {
            PLOG_INFO_(Diagnostics::kLogInstance) << "[Engine] " << all.size() << " candidates, "
                                                  << result.detections.size() << " retained: "
                                                  << Diagnostics::Preview(result.masked_text);
        }
    }

    result.processing_time_ms =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
    return result;
}

std::vector<SpanCandidate> DetectionEngine::runPatternStage(const std::wstring& text) const
{
    CandidateList candidates;
    if (!analyzer_)
        return candidates;

    auto results = analyzer_->analyze(text);
    candidates.reserve(results.size());

    std::size_t skipped = 0;
    for (auto& r : results)
    {
        if (r.start >= r.end || r.end > text.size() || !isValidScore(r.score))
        {
            PLOG_WARNING << "[Engine] skipping invalid span from " << analyzer_->analyzerName() << ": "
                         << r.entity_type << " [" << r.start << ", " << r.end << ") score " << r.score;
            ++skipped;
            continue;
        }

        SpanCandidate candidate;
        candidate.entity_type = entityTypeFromTag(r.entity_type);
        candidate.entity_tag = std::move(r.entity_type);
        candidate.start = r.start;
        candidate.end = r.end;
        candidate.matched_text = wideToUtf8(std::wstring_view(text).substr(r.start, r.end - r.start));
        candidate.score = r.score;
        candidate.source_method = SourceMethod::Pattern;
        candidates.push_back(std::move(candidate));
    }

    if (skipped > 0)
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::PatternAnalysis,
                                            "Ignored invalid spans from pattern analyzer",
                                            std::string(analyzer_->analyzerName()) + ": " +
                                                std::to_string(skipped) + " spans");
    }
    return candidates;
}

std::vector<SpanCandidate> DetectionEngine::runDictionaryStage(const std::wstring& text) const
{
    if (!terms_)
        return {};
    // One snapshot for the whole call
    auto snapshot = terms_->snapshot();
    if (!snapshot)
        return {};
    return dictionary::DictionaryMatcher::match(text, *snapshot);
}

std::vector<SpanCandidate> DetectionEngine::runContextStage(const std::wstring& text) const
{
    if (!context_)
        return {};
    return context_->detect(text);
}

bool DetectionEngine::shouldRunContext(std::size_t prior_candidates, std::size_t text_length) const
{
    if (!config_.use_context || !context_)
        return false;

    if (prior_candidates > 0)
    {
        PLOG_DEBUG_(Diagnostics::kLogInstance) << "[Engine] context stage skipped: " << prior_candidates
                                               << " prior candidates";
        return false;
    }
    if (text_length < config_.min_text_length_for_context)
    {
        PLOG_DEBUG_(Diagnostics::kLogInstance) << "[Engine] context stage skipped: text length " << text_length
                                               << " < " << config_.min_text_length_for_context;
        return false;
    }
    return true;
}

std::vector<std::size_t> DetectionEngine::resolveIndices(const std::vector<SpanCandidate>& candidates)
{
    std::vector<std::size_t> order(candidates.size());
    std::iota(order.begin(), order.end(), std::size_t{ 0 });

    std::stable_sort(order.begin(), order.end(), [&candidates](std::size_t lhs, std::size_t rhs) {
        const auto& a = candidates[lhs];
        const auto& b = candidates[rhs];
        const int rank_a = priorityRank(a.entity_type, a.source_method);
        const int rank_b = priorityRank(b.entity_type, b.source_method);
        if (rank_a != rank_b)
            return rank_a < rank_b;
        if (a.length() != b.length())
            return a.length() > b.length();
        return a.score > b.score;
    });

    std::vector<std::size_t> accepted;
    for (auto index : order)
    {
        const auto& candidate = candidates[index];
        bool overlaps = false;
        for (auto kept : accepted)
        {
            if (candidate.overlaps(candidates[kept]))
            {
                overlaps = true;
                break;
            }
        }
        if (!overlaps)
            accepted.push_back(index);
    }
    return accepted;
}

std::vector<SpanCandidate> DetectionEngine::resolve(const std::vector<SpanCandidate>& candidates)
{
    std::vector<SpanCandidate> resolved;
    for (auto index : resolveIndices(candidates))
        resolved.push_back(candidates[index]);
    return resolved;
}

std::wstring DetectionEngine::maskWide(std::wstring text, const std::vector<SpanCandidate>& candidates,
                                       const EntityLabelTable& labels)
{
    std::vector<const SpanCandidate*> ordered;
    ordered.reserve(candidates.size());
    for (const auto& candidate : candidates)
        ordered.push_back(&candidate);
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const SpanCandidate* a, const SpanCandidate* b) { return a->start > b->start; });

    for (const auto* candidate : ordered)
    {
        if (candidate->start >= candidate->end || candidate->end > text.size())
            continue;
        const std::wstring replacement = L"[" + utf8ToWide(labels.labelFor(*candidate)) + L"]";
        text.replace(candidate->start, candidate->length(), replacement);
    }
    return text;
}

std::string DetectionEngine::mask(const std::string& text, const std::vector<SpanCandidate>& candidates,
                                  const EntityLabelTable& labels)
{
    if (candidates.empty())
        return text;
    return wideToUtf8(maskWide(utf8ToWide(text), candidates, labels));
}

} // namespace detection
