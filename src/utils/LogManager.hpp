#pragma once

#include "../config/LoggingSettings.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace utils
{

/// One plog instance writing to a rolling file, optionally echoed to the console.
struct LogTarget
{
    std::string file; // relative paths land in LoggingSettings::directory
    std::optional<plog::Severity> severity; // unset: LoggingSettings::level
    std::optional<bool> append;             // unset: LoggingSettings::append_logs
    bool echo_to_console = false;
    std::size_t max_bytes = 10 * 1024 * 1024;
    std::size_t rotations = 3;
};

/// Owns the plog appenders of the process.
///
/// Initialize() once with the [logging] settings, then Attach() one target per log instance:
/// instance 0 for setup messages, palindrome::Diagnostics::kLogInstance for core traces.
class LogManager
{
public:
    static bool Initialize(const config::LoggingSettings& settings);

    template <int InstanceId = 0>
    static bool Attach(const LogTarget& target);

    /// Mutes every attached instance. Appenders stay alive because plog keeps raw pointers to them.
    static void Shutdown();

    static bool IsInitialized();
    static const config::LoggingSettings& Settings();

private:
    static std::string PathFor(const std::string& file);

    static bool s_initialized;
    static config::LoggingSettings s_settings;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
    static std::vector<std::function<void()>> s_mute_hooks;
};

} // namespace utils
