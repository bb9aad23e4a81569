#pragma once

#include "PalindromeTypes.hpp"

#include <string_view>

namespace palindrome
{

/**
 * @brief Checks a word or phrase after normalization
 *
 * With the default options "A man a plan a canal Panama" and "Madam, I'm Adam" are palindromes.
 * Empty input is never a palindrome. Input that normalizes to nothing (e.g. "!!!") is.
 * Malformed UTF-8 bytes are compared as U+FFFD when they survive normalization.
 */
[[nodiscard]] bool isPalindrome(std::string_view text, const CheckOptions& options = {});

[[nodiscard]] bool isPalindrome(std::string_view text, bool ignore_case, bool ignore_spaces);

/**
 * @brief Checks the decimal rendering of a number
 *
 * Integers are rendered with std::to_string, strings are taken verbatim and not validated.
 * The sign takes part in the comparison, so negative integers are never palindromes.
 */
[[nodiscard]] bool isNumberPalindrome(const NumberInput& number);

/// Exact code point comparison with the reversal. Case, spaces and punctuation all count.
/// Malformed bytes compare as themselves, one byte per unit.
[[nodiscard]] bool isStrictPalindrome(std::string_view text);

} // namespace palindrome
