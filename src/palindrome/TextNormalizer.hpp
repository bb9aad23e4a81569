#pragma once

#include "PalindromeTypes.hpp"

#include <string>
#include <string_view>

namespace palindrome
{

/// Drops every code point outside [A-Za-z0-9]
[[nodiscard]] std::u32string stripNonAlnum(const std::u32string& text);

/// Lowercases each code point with the simple one-to-one mapping
[[nodiscard]] std::u32string foldCase(const std::u32string& text);

/// Decodes text and applies options: strip first, then fold case
[[nodiscard]] std::u32string normalizeForComparison(std::string_view text, const CheckOptions& options);

} // namespace palindrome
