#include "ConfigManager.hpp"
#include "../palindrome/Diagnostics.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <chrono>

namespace fs = std::filesystem;

namespace config
{

namespace
{

long long file_mtime_ms(const fs::path& p)
{
    std::error_code ec;
    auto tp = fs::last_write_time(p, ec);
    if (ec)
        return 0;
    auto sctp = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        tp - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
    return std::chrono::duration_cast<std::chrono::milliseconds>(sctp.time_since_epoch()).count();
}

void reportInvalid(const std::string& key, const std::string& reason)
{
    utils::ErrorReporter::Warn(utils::ErrorCategory::Configuration, "Invalid value for " + key + ", keeping default",
                               reason);
}

// Reads section[key] into out. Absent keys are fine; present keys of the wrong type are reported.
template <typename T>
bool readValue(const toml::table& section, const char* section_name, const char* key, T& out)
{
    const auto node = section[key];
    if (!node)
        return false;

    if (auto value = node.template value<T>())
    {
        out = *value;
        return true;
    }

    reportInvalid(std::string(section_name) + "." + key, "unexpected type");
    return false;
}

} // namespace

ConfigManager::ConfigManager(std::string config_path)
    : config_path_(std::move(config_path))
{
    last_mtime_ = file_mtime_ms(config_path_);
}

ConfigManager::~ConfigManager() = default;

void ConfigManager::applyDefaults()
{
    check_options_ = palindrome::CheckOptions{};
    min_length_ = palindrome::kDefaultMinLength;
    logging_ = LoggingSettings{};
}

bool ConfigManager::load()
{
    last_error_.clear();
    applyDefaults();

    std::ifstream ifs(config_path_, std::ios::binary);
    if (!ifs)
    {
        PLOG_INFO << "No config at " << config_path_ << ", using defaults";
        return true;
    }

    try
    {
        toml::table root = toml::parse(ifs, config_path_);

        if (const auto* section = root["palindrome"].as_table())
            loadPalindromeSection(*section);
        if (const auto* section = root["logging"].as_table())
            loadLoggingSection(*section);

        last_mtime_ = file_mtime_ms(config_path_);
        return true;
    }
    catch (const toml::parse_error& pe)
    {
        last_error_ = std::string("config parse error: ") + std::string(pe.description());

        std::string error_details;
        if (pe.source().begin.line > 0)
        {
            error_details = "Error at line " + std::to_string(pe.source().begin.line) + ": " + std::string(pe.description());
        }
        else
        {
            error_details = std::string(pe.description());
        }

        utils::ErrorReporter::Fail(utils::ErrorCategory::Configuration, "Configuration file has errors. Using defaults.",
                                   error_details + "\nFile: " + config_path_);
        applyDefaults();
        return false;
    }
}

bool ConfigManager::reloadIfChanged()
{
    auto mtime = file_mtime_ms(config_path_);
    if (mtime == 0 || mtime == last_mtime_)
        return false;

    if (load())
    {
        PLOG_INFO << "Config reloaded from " << config_path_;
        return true;
    }

    // keep retrying only once the file changes again
    last_mtime_ = mtime;
    return false;
}

void ConfigManager::applyDiagnostics() const
{
    palindrome::Diagnostics::SetVerbose(logging_.verbose);
    palindrome::Diagnostics::SetMaxPreview(logging_.max_preview);
}

void ConfigManager::loadPalindromeSection(const toml::table& section)
{
    readValue(section, "palindrome", "ignore_case", check_options_.ignore_case);
    readValue(section, "palindrome", "ignore_spaces", check_options_.ignore_spaces);

    int64_t min_length = 0;
    if (readValue(section, "palindrome", "min_length", min_length))
    {
        if (min_length >= 1)
            min_length_ = static_cast<std::size_t>(min_length);
        else
            reportInvalid("palindrome.min_length", "must be at least 1, got " + std::to_string(min_length));
    }
}

void ConfigManager::loadLoggingSection(const toml::table& section)
{
    readValue(section, "logging", "append_logs", logging_.append_logs);
    readValue(section, "logging", "directory", logging_.directory);
    readValue(section, "logging", "verbose", logging_.verbose);

    int64_t level = 0;
    if (readValue(section, "logging", "level", level))
    {
        if (level >= plog::none && level <= plog::verbose)
            logging_.level = static_cast<plog::Severity>(level);
        else
            reportInvalid("logging.level", "expected 0..6, got " + std::to_string(level));
    }

    int64_t max_preview = 0;
    if (readValue(section, "logging", "max_preview", max_preview))
    {
        if (max_preview >= 1)
            logging_.max_preview = static_cast<std::size_t>(max_preview);
        else
            reportInvalid("logging.max_preview", "must be at least 1, got " + std::to_string(max_preview));
    }
}

} // namespace config
