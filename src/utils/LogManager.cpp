#include "LogManager.hpp"
#include "ErrorReporter.hpp"
#include "../palindrome/Diagnostics.hpp"

#include <filesystem>
#include <fstream>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>

namespace utils
{

bool LogManager::s_initialized = false;
config::LoggingSettings LogManager::s_settings;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;
std::vector<std::function<void()>> LogManager::s_mute_hooks;

bool LogManager::Initialize(const config::LoggingSettings& settings)
{
    s_settings = settings;
    s_initialized = false;

    if (!s_settings.directory.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(s_settings.directory, ec);
        if (ec)
        {
            ErrorReporter::Fail(ErrorCategory::Initialization, "Unable to create log directory",
                                s_settings.directory + ": " + ec.message());
            return false;
        }
    }

    s_initialized = true;
    return true;
}

template <int InstanceId>
bool LogManager::Attach(const LogTarget& target)
{
    if (!s_initialized)
    {
        ErrorReporter::Fail(ErrorCategory::Initialization, "LogManager::Attach called before Initialize",
                            target.file);
        return false;
    }

    try
    {
        const std::string path = PathFor(target.file);
        if (!target.append.value_or(s_settings.append_logs))
            std::ofstream(path, std::ios::trunc).close();

        auto file_appender =
            std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(path.c_str(), target.max_bytes,
                                                                            target.rotations);
        const plog::Severity severity = target.severity.value_or(s_settings.level);

        // plog::init only applies the severity the first time an instance is created
        auto& logger = plog::init<InstanceId>(severity, file_appender.get());
        logger.setMaxSeverity(severity);
        s_appenders.push_back(std::move(file_appender));

        if (target.echo_to_console)
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>();
            logger.addAppender(console_appender.get());
            s_appenders.push_back(std::move(console_appender));
        }

        s_mute_hooks.emplace_back([]
                                  {
                                      if (auto* muted = plog::get<InstanceId>())
                                          muted->setMaxSeverity(plog::none);
                                  });
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::Fail(ErrorCategory::Initialization, "Unable to open log file " + target.file, ex.what());
        return false;
    }
}

template bool LogManager::Attach<0>(const LogTarget&);
template bool LogManager::Attach<palindrome::Diagnostics::kLogInstance>(const LogTarget&);

void LogManager::Shutdown()
{
    for (const auto& mute : s_mute_hooks)
        mute();
    s_mute_hooks.clear();
    s_initialized = false;
}

bool LogManager::IsInitialized() { return s_initialized; }

const config::LoggingSettings& LogManager::Settings() { return s_settings; }

std::string LogManager::PathFor(const std::string& file)
{
    std::filesystem::path path(file);
    if (path.is_absolute() || s_settings.directory.empty())
        return path.string();
    return (std::filesystem::path(s_settings.directory) / path).string();
}

} // namespace utils
