#include "PalindromeChecker.hpp"
#include "Diagnostics.hpp"
#include "TextNormalizer.hpp"
#include "TextUtils.hpp"

namespace palindrome
{

namespace
{

std::string toDecimalString(const NumberInput& number)
{
    if (const auto* value = std::get_if<std::int64_t>(&number))
        return std::to_string(*value);
    return std::get<std::string>(number);
}

} // namespace

bool isPalindrome(std::string_view text, const CheckOptions& options)
{
    if (text.empty())
        return false;

    const bool verdict = isMirror(normalizeForComparison(text, options));
    Diagnostics::TraceVerdict("normalized", text, verdict);
    return verdict;
}

bool isPalindrome(std::string_view text, bool ignore_case, bool ignore_spaces)
{
    CheckOptions options;
    options.ignore_case = ignore_case;
    options.ignore_spaces = ignore_spaces;
    return isPalindrome(text, options);
}

bool isNumberPalindrome(const NumberInput& number)
{
    const std::string num_str = toDecimalString(number);
    const bool verdict = isMirror(splitUtf8Units(num_str));
    Diagnostics::TraceVerdict("number", num_str, verdict);
    return verdict;
}

bool isStrictPalindrome(std::string_view text)
{
    if (text.empty())
        return false;

    const bool verdict = isMirror(splitUtf8Units(text));
    Diagnostics::TraceVerdict("strict", text, verdict);
    return verdict;
}

} // namespace palindrome
