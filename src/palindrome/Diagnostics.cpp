#include "Diagnostics.hpp"

#include <plog/Log.h>

namespace palindrome
{

namespace
{

void appendEscaped(std::string& out, char ch)
{
    const auto byte = static_cast<unsigned char>(ch);
    if (ch == '\n')
        out += "\\n";
    else if (ch == '\r')
        out += "\\r";
    else if (ch == '\t')
        out += "\\t";
    else if (byte < 0x20u || byte == 0x7Fu)
        out += '?';
    else
        out += ch;
}

bool isContinuationByte(char ch)
{
    return (static_cast<unsigned char>(ch) & 0xC0u) == 0x80u;
}

} // namespace

std::atomic<bool> Diagnostics::verbose_{ false };
std::atomic<std::size_t> Diagnostics::max_preview_{ Diagnostics::kDefaultMaxPreview };

void Diagnostics::SetVerbose(bool enabled) noexcept
{
    verbose_.store(enabled, std::memory_order_relaxed);
}

bool Diagnostics::IsVerbose() noexcept { return verbose_.load(std::memory_order_relaxed); }

void Diagnostics::SetMaxPreview(std::size_t bytes) noexcept
{
    max_preview_.store(bytes == 0 ? 1 : bytes, std::memory_order_relaxed);
}

std::size_t Diagnostics::MaxPreview() noexcept { return max_preview_.load(std::memory_order_relaxed); }

std::string Diagnostics::Preview(std::string_view text)
{
    std::size_t cut = text.size();
    if (cut > MaxPreview())
    {
        cut = MaxPreview();
        while (cut > 0 && isContinuationByte(text[cut]))
            --cut;
    }

    std::string out;
    out.reserve(cut + 16);
    for (char ch : text.substr(0, cut))
        appendEscaped(out, ch);

    if (cut < text.size())
        out += "... (" + std::to_string(text.size()) + " bytes)";
    return out;
}

void Diagnostics::TraceVerdict(std::string_view check, std::string_view input, bool is_palindrome)
{
    if (!IsVerbose())
        return;
    PLOG_DEBUG_(kLogInstance) << "[PalindromeChecker] check=" << check << " input=" << Preview(input)
                              << " result=" << (is_palindrome ? "palindrome" : "not_palindrome");
}

void Diagnostics::TraceSearch(std::string_view input, std::size_t min_length, std::size_t found)
{
    if (!IsVerbose())
        return;
    PLOG_DEBUG_(kLogInstance) << "[PalindromeFinder] input=" << Preview(input) << " min_length=" << min_length
                              << " found=" << found;
}

void Diagnostics::TraceMirror(std::string_view input, std::string_view output)
{
    if (!IsVerbose())
        return;
    PLOG_DEBUG_(kLogInstance) << "[PalindromeGenerator] input=" << Preview(input) << " output=" << Preview(output);
}

void Diagnostics::WarnMalformed(std::string_view input, std::size_t bad_bytes)
{
    PLOG_WARNING_(kLogInstance) << "[TextUtils] replaced " << bad_bytes
                                << " malformed UTF-8 byte(s) in: " << Preview(input);
}

} // namespace palindrome
