#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_set>
#include <variant>

namespace palindrome
{

/// Default minimum substring length for findPalindromes
constexpr std::size_t kDefaultMinLength = 3;

/// Normalization applied by isPalindrome before comparing against the reversal
struct CheckOptions
{
    bool ignore_case = true;   // lowercase every code point
    bool ignore_spaces = true; // drop everything that is not [A-Za-z0-9]
};

/// Integer | DecimalString. Stringified once, then compared verbatim.
using NumberInput = std::variant<std::int64_t, std::string>;

/// Unique palindromic substrings in their original casing, unordered
using PalindromeSet = std::unordered_set<std::string>;

} // namespace palindrome
