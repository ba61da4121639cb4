#pragma once

#include <string_view>

namespace detection::validators
{

/// Luhn checksum over the digits of a card number; separators are ignored.
bool passesLuhn(std::wstring_view candidate);

/// True when every dotted octet of an IPv4 candidate is in 0-255.
bool isValidIpv4(std::wstring_view candidate);

} // namespace detection::validators
