#include "TextUtils.hpp"
#include "Diagnostics.hpp"

#include <algorithm>
#include <cstddef>
#include <utf8proc.h>

namespace palindrome
{

namespace
{

// Length of the code point at the front of text, or a negative utf8proc error code
utf8proc_ssize_t decodeFront(std::string_view text, utf8proc_int32_t& codepoint)
{
    return utf8proc_iterate(reinterpret_cast<const utf8proc_uint8_t*>(text.data()),
                            static_cast<utf8proc_ssize_t>(text.size()), &codepoint);
}

template <typename Range>
bool readsBothWays(const Range& r) noexcept
{
    return std::equal(r.begin(), r.begin() + static_cast<std::ptrdiff_t>(r.size() / 2), r.rbegin());
}

} // namespace

std::u32string utf8ToUtf32(std::string_view utf8_str)
{
    std::u32string result;
    result.reserve(utf8_str.size());

    std::size_t malformed = 0;
    std::string_view rest = utf8_str;
    while (!rest.empty())
    {
        utf8proc_int32_t codepoint = 0;
        utf8proc_ssize_t bytes = decodeFront(rest, codepoint);
        if (bytes <= 0)
        {
            result.push_back(REPLACEMENT_CHAR);
            ++malformed;
            bytes = 1;
        }
        else
        {
            result.push_back(static_cast<char32_t>(codepoint));
        }
        rest.remove_prefix(static_cast<std::size_t>(bytes));
    }

    if (malformed > 0)
        Diagnostics::WarnMalformed(utf8_str, malformed);
    return result;
}

std::vector<std::string_view> splitUtf8Units(std::string_view utf8_str)
{
    std::vector<std::string_view> units;
    units.reserve(utf8_str.size());

    std::size_t malformed = 0;
    std::size_t pos = 0;
    while (pos < utf8_str.size())
    {
        utf8proc_int32_t codepoint = 0;
        utf8proc_ssize_t bytes = decodeFront(utf8_str.substr(pos), codepoint);
        if (bytes <= 0)
        {
            ++malformed;
            bytes = 1;
        }
        units.push_back(utf8_str.substr(pos, static_cast<std::size_t>(bytes)));
        pos += static_cast<std::size_t>(bytes);
    }

    if (malformed > 0)
        Diagnostics::WarnMalformed(utf8_str, malformed);
    return units;
}

std::string utf32ToUtf8(const std::u32string& utf32_str)
{
    std::string result;
    result.reserve(utf32_str.size());
    for (char32_t cp : utf32_str)
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

bool isAsciiAlnum(char32_t cp) noexcept
{
    return (cp >= U'a' && cp <= U'z') || (cp >= U'A' && cp <= U'Z') || (cp >= U'0' && cp <= U'9');
}

bool isAlnumCodepoint(char32_t cp) noexcept
{
    switch (utf8proc_category(static_cast<utf8proc_int32_t>(cp)))
    {
    case UTF8PROC_CATEGORY_LU:
    case UTF8PROC_CATEGORY_LL:
    case UTF8PROC_CATEGORY_LT:
    case UTF8PROC_CATEGORY_LM:
    case UTF8PROC_CATEGORY_LO:
    case UTF8PROC_CATEGORY_ND:
    case UTF8PROC_CATEGORY_NL:
    case UTF8PROC_CATEGORY_NO:
        return true;
    default:
        return false;
    }
}

char32_t toLowerCodepoint(char32_t cp) noexcept
{
    if (cp < 0x80u)
        return (cp >= U'A' && cp <= U'Z') ? cp + (U'a' - U'A') : cp;
    return static_cast<char32_t>(utf8proc_tolower(static_cast<utf8proc_int32_t>(cp)));
}

bool isMirror(std::u32string_view s) noexcept
{
    return readsBothWays(s);
}

bool isMirror(const std::vector<std::string_view>& units) noexcept
{
    return readsBothWays(units);
}

} // namespace palindrome
