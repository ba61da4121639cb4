#pragma once

#include "detection/EntityLabelTable.hpp"
#include "detection/SpanCandidate.hpp"
#include "dictionary/DictionaryTerm.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace cli
{

// {original_text, masked_text, detections[], processing_time_ms, detection_count}
nlohmann::json detectionResultToJson(const detection::DetectionResult& result,
                                     const detection::EntityLabelTable& labels);

// {entries[{value, label, category}], count}
nlohmann::json termListToJson(const dictionary::TermList& terms);

// Two-space indent. Invalid UTF-8 in strings is replaced instead of throwing.
std::string dumpJson(const nlohmann::json& j);

} // namespace cli
