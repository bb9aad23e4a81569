#include <catch2/catch_test_macros.hpp>
#include "palindrome/PalindromeChecker.hpp"
#include "palindrome/TextNormalizer.hpp"
#include "palindrome/TextUtils.hpp"

#include <algorithm>
#include <string>
#include <vector>

using namespace palindrome;

TEST_CASE("isPalindrome accepts classic words", "[palindrome_checker]")
{
    for (const char* word : { "racecar", "level", "kayak", "deified", "rotator", "Madam", "radar", "civic", "refer" })
    {
        INFO(word);
        REQUIRE(isPalindrome(word));
    }
}

TEST_CASE("isPalindrome accepts famous phrases", "[palindrome_checker]")
{
    const std::vector<std::string> phrases = {
        "A man a plan a canal Panama",
        "Was it a car or a cat I saw?",
        "Never odd or even",
        "Do geese see God?",
        "Madam, I'm Adam",
        "Mr. Owl ate my metal worm",
        "No lemon, no melon",
        "A Santa at NASA",
        "Step on no pets",
    };

    for (const auto& phrase : phrases)
    {
        INFO(phrase);
        REQUIRE(isPalindrome(phrase));
    }
}

TEST_CASE("isPalindrome handles short and alphanumeric input", "[palindrome_checker]")
{
    REQUIRE(isPalindrome("a"));
    REQUIRE(isPalindrome("aa"));
    REQUIRE_FALSE(isPalindrome("ab"));
    REQUIRE(isPalindrome("12321"));
    REQUIRE(isPalindrome("A1B2B1A"));
}

TEST_CASE("isPalindrome rejects non-palindromes", "[palindrome_checker]")
{
    REQUIRE_FALSE(isPalindrome("hello world"));
    REQUIRE_FALSE(isPalindrome("test case 1"));
    REQUIRE_FALSE(isPalindrome("python"));
}

TEST_CASE("isPalindrome rejects empty input for every option combination", "[palindrome_checker]")
{
    REQUIRE_FALSE(isPalindrome(""));
    REQUIRE_FALSE(isPalindrome("", true, true));
    REQUIRE_FALSE(isPalindrome("", true, false));
    REQUIRE_FALSE(isPalindrome("", false, true));
    REQUIRE_FALSE(isPalindrome("", false, false));
}

TEST_CASE("isPalindrome accepts input that normalizes to nothing", "[palindrome_checker]")
{
    REQUIRE(isPalindrome("!!!"));
    REQUIRE(isPalindrome(" , . "));
}

TEST_CASE("isPalindrome respects individual options", "[palindrome_checker]")
{
    SECTION("Case matters when not ignored")
    {
        REQUIRE_FALSE(isPalindrome("Racecar", false, true));
        REQUIRE(isPalindrome("racecar", false, true));
    }

    SECTION("Spaces matter when not stripped")
    {
        REQUIRE_FALSE(isPalindrome("Never odd or even", true, false));
        REQUIRE(isPalindrome("Step on no pets", true, false));
    }

    SECTION("Strict when both disabled")
    {
        REQUIRE_FALSE(isPalindrome("A man a plan a canal Panama", false, false));
        REQUIRE(isPalindrome("a b a", false, false));
    }

    SECTION("CheckOptions overload matches the flag overload")
    {
        CheckOptions options;
        options.ignore_case = false;
        REQUIRE(isPalindrome("Abba", options) == isPalindrome("Abba", false, true));
    }
}

TEST_CASE("isPalindrome strips non-ASCII letters", "[palindrome_checker]")
{
    // "é" is dropped by stripping, leaving "t"
    REQUIRE(isPalindrome("été"));
    REQUIRE(isPalindrome("ét", true, true));
    REQUIRE_FALSE(isPalindrome("ét", true, false));
}

TEST_CASE("isPalindrome folds non-ASCII case when not stripping", "[palindrome_checker]")
{
    REQUIRE(isPalindrome("Été", true, false));
    REQUIRE_FALSE(isPalindrome("Été", false, false));
}

TEST_CASE("isPalindrome verdict survives re-normalization", "[palindrome_checker]")
{
    const CheckOptions options;
    for (const char* text : { "No lemon, no melon", "Do geese see God?", "hello world" })
    {
        INFO(text);
        const std::string normalized = utf32ToUtf8(normalizeForComparison(text, options));
        REQUIRE(isPalindrome(normalized, options) == isPalindrome(text, options));
    }
}

TEST_CASE("isStrictPalindrome uses exact matching", "[palindrome_checker]")
{
    SECTION("Exact palindromes")
    {
        for (const char* text : { "racecar", "noon", "aba", "a b a", "12321", "!!!", "...", "a b c b a" })
        {
            INFO(text);
            REQUIRE(isStrictPalindrome(text));
        }
    }

    SECTION("Case, spaces and punctuation are significant")
    {
        for (const char* text : { "Racecar", "A man", "race car", "Madam" })
        {
            INFO(text);
            REQUIRE_FALSE(isStrictPalindrome(text));
        }
    }

    SECTION("Empty input")
    {
        REQUIRE_FALSE(isStrictPalindrome(""));
    }
}

TEST_CASE("isStrictPalindrome reverses code points, not bytes", "[palindrome_checker]")
{
    REQUIRE(isStrictPalindrome("été"));
    REQUIRE(isStrictPalindrome("しんぶんし"));
    REQUIRE_FALSE(isStrictPalindrome("étè"));
}

TEST_CASE("isStrictPalindrome compares malformed bytes as themselves", "[palindrome_checker][utf8]")
{
    REQUIRE_FALSE(isStrictPalindrome("\xFF" "a" "\xFE"));
    REQUIRE(isStrictPalindrome("\xFF" "a" "\xFF"));
    REQUIRE(isStrictPalindrome("\xE3" "\xE3"));
    REQUIRE_FALSE(isStrictPalindrome("\xC3" "\xA9" "\xA9" "\xC3")); // "é" then its bytes reversed
}

TEST_CASE("isStrictPalindrome agrees with reversal for sample strings", "[palindrome_checker]")
{
    const std::vector<std::string> samples = { "x", "xy", "xyx", "Step on no pets", "step on no pets", "0110", "-1-" };
    for (const auto& s : samples)
    {
        std::string reversed(s.rbegin(), s.rend());
        INFO(s);
        REQUIRE(isStrictPalindrome(s) == (s == reversed));
    }
}
