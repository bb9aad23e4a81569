#pragma once

#include "LoggingSettings.hpp"
#include "../palindrome/PalindromeTypes.hpp"

#include <cstddef>
#include <string>

#include <toml++/toml.h>

namespace config
{

/// Loads palindrome defaults and logging settings from a TOML file.
///
///   [palindrome]  ignore_case, ignore_spaces, min_length
///   [logging]     append_logs, level, directory, verbose, max_preview
///
/// Missing files and missing keys keep the built-in defaults.
class ConfigManager
{
public:
    explicit ConfigManager(std::string config_path = "config.toml");
    ~ConfigManager();

    bool load();
    bool reloadIfChanged();

    const palindrome::CheckOptions& checkOptions() const { return check_options_; }
    std::size_t minLength() const { return min_length_; }
    const LoggingSettings& logging() const { return logging_; }
    const std::string& path() const { return config_path_; }

    /// Pushes the verbose and preview settings into palindrome::Diagnostics
    void applyDiagnostics() const;

    const char* lastError() const { return last_error_.c_str(); }

private:
    void applyDefaults();
    void loadPalindromeSection(const toml::table& section);
    void loadLoggingSection(const toml::table& section);

    std::string config_path_;
    std::string last_error_;
    long long last_mtime_ = 0;

    palindrome::CheckOptions check_options_;
    std::size_t min_length_ = palindrome::kDefaultMinLength;
    LoggingSettings logging_;
};

} // namespace config
