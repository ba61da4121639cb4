#pragma once

#include "IContextClient.hpp"
#include "../detection/SpanCandidate.hpp"

#include <memory>
#include <string>
#include <vector>

namespace context
{

/**
 * @brief Turns context client findings into span candidates.
 *
 * Each finding is located by its first occurrence in the text and dropped
 * when absent. Any client failure is logged at warning level and yields no
 * candidates; nothing is retried.
 */
class ContextDetector
{
public:
    static constexpr double kContextScore = 0.75;

    explicit ContextDetector(std::shared_ptr<const IContextClient> client);

    bool isAvailable() const;

    std::vector<detection::SpanCandidate> detect(const std::wstring& text) const;

    static detection::EntityType mapTypeLabel(const std::string& type_label);

private:
    std::shared_ptr<const IContextClient> client_;
};

} // namespace context
