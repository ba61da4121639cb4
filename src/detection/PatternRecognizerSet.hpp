#pragma once

#include "IPatternAnalyzer.hpp"
#include "PatternRecognizer.hpp"

#include <memory>
#include <vector>

namespace detection
{

// Built-in pattern-analysis capability: runs every recognizer over the
// full text and concatenates the results in registration order.
class PatternRecognizerSet : public IPatternAnalyzer
{
public:
    PatternRecognizerSet() = default;
    explicit PatternRecognizerSet(std::vector<PatternRecognizer> recognizers);

    // Japanese locale recognizers followed by the generic ones
    static std::shared_ptr<const PatternRecognizerSet> createDefault();

    void addRecognizer(PatternRecognizer recognizer);

    const char* analyzerName() const override { return "PatternRecognizerSet"; }
    std::vector<AnalyzerResult> analyze(const std::wstring& text) const override;

    const std::vector<PatternRecognizer>& recognizers() const { return recognizers_; }

private:
    std::vector<PatternRecognizer> recognizers_;
};

} // namespace detection
