#include "TextUtils.hpp"
#include <utf8proc.h>

namespace detection
{

std::wstring utf8ToWide(std::string_view utf8_str, std::size_t* replaced)
{
    if (replaced)
        *replaced = 0;

    std::wstring result;
    if (utf8_str.empty())
        return result;

    const utf8proc_uint8_t* str = reinterpret_cast<const utf8proc_uint8_t*>(utf8_str.data());
    utf8proc_ssize_t len = static_cast<utf8proc_ssize_t>(utf8_str.size());
    result.reserve(utf8_str.size());

    utf8proc_ssize_t pos = 0;
    while (pos < len)
    {
        utf8proc_int32_t codepoint;
        utf8proc_ssize_t bytes = utf8proc_iterate(str + pos, len - pos, &codepoint);
        if (bytes <= 0)
        {
            // One replacement character per offending byte, then resynchronise
            result.push_back(kReplacementCharacter);
            if (replaced)
                ++*replaced;
            ++pos;
            continue;
        }
        result.push_back(static_cast<wchar_t>(codepoint));
        pos += bytes;
    }
    return result;
}

std::string wideToUtf8(std::wstring_view wide_str)
{
    std::string result;
    result.reserve(wide_str.size() * 3);
    for (wchar_t cp : wide_str)
    {
        utf8proc_uint8_t buffer[4];
        utf8proc_ssize_t bytes = utf8proc_encode_char(static_cast<utf8proc_int32_t>(cp), buffer);
        if (bytes > 0)
        {
            result.append(reinterpret_cast<const char*>(buffer), static_cast<size_t>(bytes));
        }
    }
    return result;
}

} // namespace detection
