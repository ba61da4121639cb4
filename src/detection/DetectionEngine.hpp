#pragma once

#include "EntityLabelTable.hpp"
#include "IPatternAnalyzer.hpp"
#include "SpanCandidate.hpp"
#include "../context/ContextDetector.hpp"
#include "../dictionary/DictionaryTerm.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace detection
{

struct EngineConfig
{
    bool use_context = false;
    std::size_t min_text_length_for_context = 50; // codepoints
};

/**
 * @brief Fuses pattern, dictionary and context candidates into one redaction.
 *
 * Pattern and dictionary stages always run. The context stage runs only when
 * enabled, when neither earlier stage produced a candidate, and when the text
 * is long enough. Overlaps are resolved by priority rank, then span length,
 * then score; the surviving spans are replaced by "[label]".
 *
 * The engine is immutable after construction and detect() may be called from
 * several threads at once. Use withConfig() to obtain a differently
 * configured engine.
 */
class DetectionEngine
{
public:
    DetectionEngine(EngineConfig config, std::shared_ptr<const IPatternAnalyzer> analyzer,
                    std::shared_ptr<const dictionary::ITermSource> terms,
                    std::shared_ptr<const context::ContextDetector> context = nullptr,
                    std::shared_ptr<const EntityLabelTable> labels = nullptr);

    DetectionResult detect(const std::string& text) const;

    // New engine with the same collaborators and a different configuration
    DetectionEngine withConfig(const EngineConfig& config) const;

    bool isContextAvailable() const;

    const EngineConfig& config() const { return config_; }
    const EntityLabelTable& labels() const { return *labels_; }

    /**
     * @brief Reduce candidates to a disjoint set.
     *
     * Stable sort by (rank, -length, -score), then greedy acceptance of every
     * candidate that does not overlap an accepted one. The order of the
     * returned candidates is not specified.
     */
    static std::vector<SpanCandidate> resolve(const std::vector<SpanCandidate>& candidates);

    /**
     * @brief Replace each span with "[label]", right to left.
     *
     * @p candidates must be disjoint and carry codepoint offsets into @p text.
     */
    static std::string mask(const std::string& text, const std::vector<SpanCandidate>& candidates,
                            const EntityLabelTable& labels);

private:
    std::vector<SpanCandidate> runPatternStage(const std::wstring& text) const;
    std::vector<SpanCandidate> runDictionaryStage(const std::wstring& text) const;
    std::vector<SpanCandidate> runContextStage(const std::wstring& text) const;
    bool shouldRunContext(std::size_t prior_candidates, std::size_t text_length) const;

    // Indices of accepted candidates, in acceptance order
    static std::vector<std::size_t> resolveIndices(const std::vector<SpanCandidate>& candidates);

    static std::wstring maskWide(std::wstring text, const std::vector<SpanCandidate>& candidates,
                                 const EntityLabelTable& labels);

    EngineConfig config_;
    std::shared_ptr<const IPatternAnalyzer> analyzer_;
    std::shared_ptr<const dictionary::ITermSource> terms_;
    std::shared_ptr<const context::ContextDetector> context_;
    std::shared_ptr<const EntityLabelTable> labels_;
};

} // namespace detection
