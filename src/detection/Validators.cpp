#include "Validators.hpp"
#include "TextUtils.hpp"

namespace detection::validators
{

bool passesLuhn(std::wstring_view candidate)
{
    int sum = 0;
    int digits = 0;
    bool double_it = false;
    for (auto it = candidate.rbegin(); it != candidate.rend(); ++it)
    {
        if (!isAsciiDigit(*it))
            continue;
        int d = static_cast<int>(*it - L'0');
        if (double_it)
        {
            d *= 2;
            if (d > 9)
                d -= 9;
        }
        sum += d;
        double_it = !double_it;
        ++digits;
    }
    return digits >= 12 && sum % 10 == 0;
}

bool isValidIpv4(std::wstring_view candidate)
{
    int octets = 0;
    int value = 0;
    int width = 0;
    for (wchar_t c : candidate)
    {
        if (c == L'.')
        {
            if (width == 0 || value > 255)
                return false;
            ++octets;
            value = 0;
            width = 0;
            continue;
        }
        if (!isAsciiDigit(c))
            return false;
        value = value * 10 + static_cast<int>(c - L'0');
        ++width;
    }
    if (width == 0 || value > 255)
        return false;
    return octets + 1 == 4;
}

} // namespace detection::validators
