#include "PatternRecognizerSet.hpp"
#include "JapanesePatterns.hpp"

#include <iterator>

namespace detection
{

PatternRecognizerSet::PatternRecognizerSet(std::vector<PatternRecognizer> recognizers)
    : recognizers_(std::move(recognizers))
{
}

std::shared_ptr<const PatternRecognizerSet> PatternRecognizerSet::createDefault()
{
    auto recognizers = createJapaneseRecognizers();
    auto generic = createGenericRecognizers();
    recognizers.insert(recognizers.end(), std::make_move_iterator(generic.begin()),
                       std::make_move_iterator(generic.end()));
    return std::make_shared<const PatternRecognizerSet>(std::move(recognizers));
}

void PatternRecognizerSet::addRecognizer(PatternRecognizer recognizer)
{
    recognizers_.push_back(std::move(recognizer));
}

std::vector<AnalyzerResult> PatternRecognizerSet::analyze(const std::wstring& text) const
{
    std::vector<AnalyzerResult> results;
    for (const auto& recognizer : recognizers_)
    {
        auto found = recognizer.analyze(text);
        results.insert(results.end(), std::make_move_iterator(found.begin()), std::make_move_iterator(found.end()));
    }
    return results;
}

} // namespace detection
