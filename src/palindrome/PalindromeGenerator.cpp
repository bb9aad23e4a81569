#include "PalindromeGenerator.hpp"
#include "Diagnostics.hpp"
#include "TextUtils.hpp"

namespace palindrome
{

std::string generatePalindrome(std::string_view word)
{
    const std::vector<std::string_view> units = splitUtf8Units(word);

    std::string result(word);
    if (units.size() > 1)
    {
        result.reserve(word.size() * 2);
        for (auto it = units.rbegin() + 1; it != units.rend(); ++it)
            result.append(*it);
    }

    Diagnostics::TraceMirror(word, result);
    return result;
}

} // namespace palindrome
