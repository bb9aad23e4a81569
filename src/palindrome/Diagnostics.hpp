#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include <string_view>

namespace palindrome
{

/// Tracing for the palindrome operations.
/// Everything goes to the plog instance kLogInstance; Trace* calls are dropped unless verbose.
class Diagnostics
{
public:
    static constexpr int kLogInstance = 1;
    static constexpr std::size_t kDefaultMaxPreview = 160;

    static void SetVerbose(bool enabled) noexcept;
    [[nodiscard]] static bool IsVerbose() noexcept;

    static void SetMaxPreview(std::size_t bytes) noexcept;
    [[nodiscard]] static std::size_t MaxPreview() noexcept;

    /// Single-line rendering of text: escaped, cut at a UTF-8 boundary, size appended when cut
    [[nodiscard]] static std::string Preview(std::string_view text);

    static void TraceVerdict(std::string_view check, std::string_view input, bool is_palindrome);
    static void TraceSearch(std::string_view input, std::size_t min_length, std::size_t found);
    static void TraceMirror(std::string_view input, std::string_view output);

    /// Always logged as a warning, verbose or not
    static void WarnMalformed(std::string_view input, std::size_t bad_bytes);

private:
    static std::atomic<bool> verbose_;
    static std::atomic<std::size_t> max_preview_;
};

} // namespace palindrome
