#pragma once

#include "PalindromeTypes.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace palindrome
{

/**
 * @brief Collects every palindromic substring of text
 *
 * A substring qualifies when it is at least min_length code points long, consists only of
 * letters and numbers, and reads the same both ways once lowercased. Entries keep the casing
 * they have in text; repeated occurrences collapse into one entry.
 *
 * Substrings with spaces or punctuation never qualify, so "a b a" yields nothing.
 * A min_length of 0 is treated as 1.
 */
[[nodiscard]] PalindromeSet findPalindromes(std::string_view text, std::size_t min_length = kDefaultMinLength);

/// Longest first, equal lengths in lexicographic order
[[nodiscard]] std::vector<std::string> sortByLengthDescending(const PalindromeSet& found);

} // namespace palindrome
