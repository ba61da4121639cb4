#include "Diagnostics.hpp"

#include <cstdio>

namespace detection
{

std::atomic<bool> Diagnostics::verbose_{ false };

std::string Diagnostics::Preview(std::string_view text, std::size_t max_codepoints)
{
    std::string out;
    std::size_t codepoints = 0;
    std::size_t i = 0;
    for (; i < text.size(); ++i)
    {
        const auto byte = static_cast<unsigned char>(text[i]);
        const bool continuation = (byte & 0xC0u) == 0x80u;
        if (!continuation)
        {
            if (codepoints == max_codepoints)
                break;
            ++codepoints;
        }

        if (byte < 0x20u || byte == 0x7Fu)
        {
            char escaped[5];
            std::snprintf(escaped, sizeof(escaped), "\\x%02X", byte);
            out += escaped;
        }
        else
        {
            out.push_back(static_cast<char>(byte));
        }
    }

    if (i < text.size())
        out += "...(" + std::to_string(text.size()) + " bytes)";
    return out;
}

} // namespace detection
