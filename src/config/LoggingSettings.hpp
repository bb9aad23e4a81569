#pragma once

#include <cstddef>
#include <string>

#include <plog/Severity.h>

namespace config
{

struct LoggingSettings
{
    bool append_logs = true;
    plog::Severity level = plog::info;
    std::string directory = "logs";
    bool verbose = false;              // palindrome::Diagnostics tracing
    std::size_t max_preview = 160;     // bytes shown per text in traces
};

} // namespace config
