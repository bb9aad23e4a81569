#pragma once

#include <string>
#include <string_view>

namespace palindrome
{

/**
 * @brief Mirrors word around its last code point
 *
 * The result is word followed by the reverse of everything but its last code point,
 * e.g. "hello" -> "hellolleh", "ab" -> "aba". Words shorter than two code points are
 * returned unchanged ("" -> "", "a" -> "a"). Non-empty output is always a strict palindrome.
 *
 * Code points are moved as whole byte sequences and a malformed byte is moved as a unit of
 * its own, so the output always starts with the exact bytes of word.
 */
[[nodiscard]] std::string generatePalindrome(std::string_view word);

} // namespace palindrome
