#include "ContextDetector.hpp"
#include "../detection/Diagnostics.hpp"
#include "../detection/TextUtils.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <utility>

namespace context
{

ContextDetector::ContextDetector(std::shared_ptr<const IContextClient> client)
    : client_(std::move(client))
{
}

bool ContextDetector::isAvailable() const
{
    if (!client_)
        return false;
    try
    {
        return client_->isAvailable();
    }
    catch (const std::exception& ex)
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::ContextDetector,
                                            std::string(client_->clientName()) + " availability probe failed",
                                            ex.what());
        return false;
    }
}

detection::EntityType ContextDetector::mapTypeLabel(const std::string& type_label)
{
    if (type_label == "個人名")
        return detection::EntityType::Person;
    if (type_label == "会社名" || type_label == "企業名")
        return detection::EntityType::Organization;
    if (type_label == "プロジェクト名")
        return detection::EntityType::ProjectName;
    return detection::EntityType::Confidential;
}

std::vector<detection::SpanCandidate> ContextDetector::detect(const std::wstring& text) const
{
    std::vector<detection::SpanCandidate> candidates;
    if (!client_ || text.empty())
        return candidates;

    if (!isAvailable())
    {
        PLOG_WARNING << "[ContextDetector] " << client_->clientName() << " unavailable, skipping context stage";
        return candidates;
    }

    std::vector<ContextFinding> findings;
    try
    {
        findings = client_->analyze(detection::wideToUtf8(text));
    }
    catch (const std::exception& ex)
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::ContextDetector,
                                            std::string(client_->clientName()) + " context detection failed",
                                            ex.what());
        return candidates;
    }

    for (const auto& finding : findings)
    {
        if (finding.value.empty())
            continue;

        const std::wstring needle = detection::utf8ToWide(finding.value);
        if (needle.empty())
            continue;

        const auto pos = text.find(needle);
        if (pos == std::wstring::npos)
        {
            PLOG_DEBUG_(detection::Diagnostics::kLogInstance)
                << "[ContextDetector] dropped finding not present in text: "
                << detection::Diagnostics::Preview(finding.value);
            continue;
        }

        detection::SpanCandidate candidate;
        candidate.entity_type = mapTypeLabel(finding.type_label);
        candidate.entity_tag = std::string(detection::entityTypeTag(candidate.entity_type));
        candidate.matched_text = detection::wideToUtf8(needle);
        candidate.start = pos;
        candidate.end = pos + needle.size();
        candidate.score = kContextScore;
        candidate.source_method = detection::SourceMethod::Context;
        candidates.push_back(std::move(candidate));
    }
    return candidates;
}

} // namespace context
