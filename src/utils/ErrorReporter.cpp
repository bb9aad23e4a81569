#include "ErrorReporter.hpp"

#include <chrono>
#include <ctime>
#include <iterator>
#include <utility>
#include <plog/Log.h>

namespace utils
{

namespace
{

std::string nowStamp()
{
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &now);
#else
    localtime_r(&now, &local);
#endif
    char buffer[20] = {};
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local);
    return buffer;
}

ErrorReport makeReport(ErrorCategory category, ErrorSeverity severity, std::string message, std::string details)
{
    ErrorReport report;
    report.category = category;
    report.severity = severity;
    report.message = std::move(message);
    report.details = std::move(details);
    report.timestamp = nowStamp();
    return report;
}

} // namespace

std::mutex ErrorReporter::s_mutex;
std::deque<ErrorReport> ErrorReporter::s_pending;

void ErrorReporter::Warn(ErrorCategory category, std::string message, std::string details)
{
    Record(makeReport(category, ErrorSeverity::Warning, std::move(message), std::move(details)));
}

void ErrorReporter::Fail(ErrorCategory category, std::string message, std::string details)
{
    Record(makeReport(category, ErrorSeverity::Error, std::move(message), std::move(details)));
}

void ErrorReporter::Record(ErrorReport report)
{
    if (report.severity == ErrorSeverity::Error)
        PLOG_ERROR << "[" << CategoryName(report.category) << "] " << report.message
                   << (report.details.empty() ? "" : " | ") << report.details;
    else
        PLOG_WARNING << "[" << CategoryName(report.category) << "] " << report.message
                     << (report.details.empty() ? "" : " | ") << report.details;

    std::lock_guard<std::mutex> lock(s_mutex);
    if (s_pending.size() == kMaxPending)
        s_pending.pop_front();
    s_pending.push_back(std::move(report));
}

std::vector<ErrorReport> ErrorReporter::TakeAll()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    std::vector<ErrorReport> taken(std::make_move_iterator(s_pending.begin()),
                                   std::make_move_iterator(s_pending.end()));
    s_pending.clear();
    return taken;
}

std::optional<ErrorReport> ErrorReporter::Latest()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    if (s_pending.empty())
        return std::nullopt;
    return s_pending.back();
}

std::size_t ErrorReporter::PendingCount()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_pending.size();
}

void ErrorReporter::Clear()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_pending.clear();
}

const char* ErrorReporter::CategoryName(ErrorCategory category) noexcept
{
    switch (category)
    {
    case ErrorCategory::Initialization:
        return "Initialization";
    case ErrorCategory::Configuration:
        return "Configuration";
    }
    return "Unknown";
}

} // namespace utils
