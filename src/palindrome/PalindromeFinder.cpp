#include "PalindromeFinder.hpp"
#include "Diagnostics.hpp"
#include "TextNormalizer.hpp"
#include "TextUtils.hpp"

#include <algorithm>
#include <utility>

namespace palindrome
{

namespace
{

std::size_t countCodepoints(const std::string& s)
{
    return static_cast<std::size_t>(std::count_if(s.begin(), s.end(), [](char c)
                                                  { return (static_cast<unsigned char>(c) & 0xC0u) != 0x80u; }));
}

// Grows [left, right] outwards inside the run [run_begin, run_end) and records every
// window that is long enough. left/right start on the center (odd) or the two center
// code points (even).
void expandAroundCenter(const std::u32string& original, const std::u32string& folded, std::size_t run_begin,
                        std::size_t run_end, std::size_t left, std::size_t right, std::size_t min_length,
                        PalindromeSet& out)
{
    while (right < run_end && folded[left] == folded[right])
    {
        const std::size_t length = right - left + 1;
        if (length >= min_length)
            out.insert(utf32ToUtf8(original.substr(left, length)));

        if (left == run_begin)
            break;
        --left;
        ++right;
    }
}

} // namespace

PalindromeSet findPalindromes(std::string_view text, std::size_t min_length)
{
    PalindromeSet palindromes;

    const std::u32string original = utf8ToUtf32(text);
    if (original.empty() || original.size() < min_length)
        return palindromes;

    const std::size_t effective_min = std::max<std::size_t>(min_length, 1);
    const std::u32string folded = foldCase(original);
    const std::size_t n = folded.size();

    // Qualifying substrings never cross a non-alphanumeric code point, so each maximal
    // alphanumeric run is searched on its own.
    std::size_t pos = 0;
    while (pos < n)
    {
        if (!isAlnumCodepoint(folded[pos]))
        {
            ++pos;
            continue;
        }

        const std::size_t run_begin = pos;
        while (pos < n && isAlnumCodepoint(folded[pos]))
            ++pos;
        const std::size_t run_end = pos;

        if (run_end - run_begin < effective_min)
            continue;

        for (std::size_t center = run_begin; center < run_end; ++center)
        {
            expandAroundCenter(original, folded, run_begin, run_end, center, center, effective_min, palindromes);
            expandAroundCenter(original, folded, run_begin, run_end, center, center + 1, effective_min, palindromes);
        }
    }

    Diagnostics::TraceSearch(text, min_length, palindromes.size());
    return palindromes;
}

std::vector<std::string> sortByLengthDescending(const PalindromeSet& found)
{
    std::vector<std::pair<std::size_t, std::string>> keyed;
    keyed.reserve(found.size());
    for (const auto& s : found)
        keyed.emplace_back(countCodepoints(s), s);

    std::sort(keyed.begin(), keyed.end(), [](const auto& a, const auto& b)
              {
                  if (a.first != b.first)
                      return a.first > b.first;
                  return a.second < b.second;
              });

    std::vector<std::string> sorted;
    sorted.reserve(keyed.size());
    for (auto& entry : keyed)
        sorted.push_back(std::move(entry.second));
    return sorted;
}

} // namespace palindrome
