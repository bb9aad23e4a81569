#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace palindrome
{

/// Substituted for every byte that does not start a valid UTF-8 sequence
constexpr char32_t REPLACEMENT_CHAR = U'\uFFFD';

/// UTF-8 to UTF-32 conversion. Malformed bytes become REPLACEMENT_CHAR, one per byte.
std::u32string utf8ToUtf32(std::string_view utf8_str);

/// Splits text into byte spans of one code point each. A malformed byte is a span of its own,
/// so joining the spans always gives back the exact input bytes.
std::vector<std::string_view> splitUtf8Units(std::string_view utf8_str);

/// UTF-32 to UTF-8 conversion
std::string utf32ToUtf8(const std::u32string& utf32_str);

/// [A-Za-z0-9] only
[[nodiscard]] bool isAsciiAlnum(char32_t cp) noexcept;

/// Unicode letter (L*) or number (N*) category
[[nodiscard]] bool isAlnumCodepoint(char32_t cp) noexcept;

/// Simple one-to-one lowercase mapping; code points without one map to themselves
[[nodiscard]] char32_t toLowerCodepoint(char32_t cp) noexcept;

/// True when the sequence reads the same in both directions. Empty counts as a mirror.
[[nodiscard]] bool isMirror(std::u32string_view s) noexcept;
[[nodiscard]] bool isMirror(const std::vector<std::string_view>& units) noexcept;

} // namespace palindrome
