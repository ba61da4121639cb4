#include "JsonOutput.hpp"

namespace cli
{

using json = nlohmann::json;

json detectionResultToJson(const detection::DetectionResult& result, const detection::EntityLabelTable& labels)
{
    json detections = json::array();
    for (const auto& d : result.detections)
    {
        detections.push_back({ { "entity_type", d.entity_tag },
                               { "text", d.matched_text },
                               { "start", d.start },
                               { "end", d.end },
                               { "score", d.score },
                               { "method", detection::sourceMethodName(d.source_method) },
                               { "label", labels.labelFor(d) } });
    }

    return { { "original_text", result.original_text },
             { "masked_text", result.masked_text },
             { "detections", std::move(detections) },
             { "processing_time_ms", result.processing_time_ms },
             { "detection_count", result.detections.size() } };
}

json termListToJson(const dictionary::TermList& terms)
{
    json entries = json::array();
    for (const auto& term : terms)
        entries.push_back({ { "value", term.value }, { "label", term.label }, { "category", term.category } });
    return { { "entries", std::move(entries) }, { "count", terms.size() } };
}

std::string dumpJson(const json& j) { return j.dump(2, ' ', false, json::error_handler_t::replace); }

} // namespace cli
