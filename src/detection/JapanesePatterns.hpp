#pragma once

#include "PatternRecognizer.hpp"

#include <string>
#include <unordered_set>
#include <vector>

namespace detection
{

/// Locale-specific recognizers: phone, postal code, address, My Number,
/// currency, company forms, honorific names and API keys.
std::vector<PatternRecognizer> createJapaneseRecognizers();

/// Generic recognizers: email, credit card, IPv4 and URL.
std::vector<PatternRecognizer> createGenericRecognizers();

/// Generic honorific phrases (role titles, generic addressees) that look
/// like names but are not.
const std::unordered_set<std::wstring>& honorificDenyList();

} // namespace detection
