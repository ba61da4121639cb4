#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace detection
{

// Codepoint strings are std::wstring so that std::wregex can scan them.
// On Linux wchar_t is UTF-32, so wstring indices are codepoint offsets.
static_assert(sizeof(wchar_t) == 4, "codepoint offsets require a 32-bit wchar_t");

constexpr wchar_t kReplacementCharacter = 0xFFFD;

/// UTF-8 to codepoint conversion. Each byte of an invalid sequence becomes
/// U+FFFD; when @p replaced is given it receives the number of such bytes.
std::wstring utf8ToWide(std::string_view utf8_str, std::size_t* replaced = nullptr);

/// Codepoint to UTF-8 conversion
std::string wideToUtf8(std::wstring_view wide_str);

/// Check if a codepoint is an ASCII digit
constexpr bool isAsciiDigit(wchar_t cp) { return cp >= L'0' && cp <= L'9'; }

} // namespace detection
