#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace utils
{

enum class ErrorCategory
{
    Initialization, // log directory, appenders
    Configuration   // TOML syntax, out of range or mistyped values
};

enum class ErrorSeverity
{
    Warning, // a default was kept, the caller carries on
    Error    // the operation failed
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Configuration;
    ErrorSeverity severity = ErrorSeverity::Warning;
    std::string message; // what went wrong
    std::string details; // offending value, parser message, OS error
    std::string timestamp;
};

/// Collects problems met while setting up logging or reading the config file.
///
/// Each report is logged through plog on the default instance and kept until the caller
/// drains it with TakeAll(). At most kMaxPending reports are kept; the oldest go first.
class ErrorReporter
{
public:
    static constexpr std::size_t kMaxPending = 100;

    static void Warn(ErrorCategory category, std::string message, std::string details = {});
    static void Fail(ErrorCategory category, std::string message, std::string details = {});

    [[nodiscard]] static std::vector<ErrorReport> TakeAll();
    [[nodiscard]] static std::optional<ErrorReport> Latest();
    [[nodiscard]] static std::size_t PendingCount();
    static void Clear();

    [[nodiscard]] static const char* CategoryName(ErrorCategory category) noexcept;

private:
    static void Record(ErrorReport report);

    static std::mutex s_mutex;
    static std::deque<ErrorReport> s_pending;
};

} // namespace utils
