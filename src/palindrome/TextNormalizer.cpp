#include "TextNormalizer.hpp"
#include "TextUtils.hpp"

#include <algorithm>
#include <iterator>

namespace palindrome
{

std::u32string stripNonAlnum(const std::u32string& text)
{
    std::u32string out;
    out.reserve(text.size());
    std::copy_if(text.begin(), text.end(), std::back_inserter(out), isAsciiAlnum);
    return out;
}

std::u32string foldCase(const std::u32string& text)
{
    std::u32string out(text.size(), U'\0');
    std::transform(text.begin(), text.end(), out.begin(), toLowerCodepoint);
    return out;
}

std::u32string normalizeForComparison(std::string_view text, const CheckOptions& options)
{
    std::u32string processed = utf8ToUtf32(text);

    if (options.ignore_spaces)
        processed = stripNonAlnum(processed);

    if (options.ignore_case)
        processed = foldCase(processed);

    return processed;
}

} // namespace palindrome
