#pragma once

#include <fmt/core.h>

#include <cstdio>
#include <mutex>
#include <string>

namespace chunkwise
{

enum class log_level
{
    debug,
    info,
    notice,
    warning,
    error
};

inline const char* level_prefix(log_level level)
{
    switch (level)
    {
        case log_level::debug:
            return "[DEBUG] ";
        case log_level::info:
            return "[INFO] ";
        case log_level::notice:
            return "[NOTICE] ";
        case log_level::warning:
            return "[WARN] ";
        case log_level::error:
            return "[ERROR] ";
    }
    return "";
}

// ============================================================================
// Logger Interface
// ============================================================================

class logger
{
public:
    virtual ~logger() = default;
    virtual void log(log_level level, const std::string& message) = 0;
};

// ============================================================================
// Built-in Implementations
// ============================================================================

class null_logger : public logger
{
public:
    void log(log_level, const std::string&) override {}
};

class console_logger : public logger
{
    std::FILE* stream_;
    log_level threshold_;
    std::mutex mutex_;

public:
    explicit console_logger(std::FILE* stream = stderr, log_level threshold = log_level::info)
      : stream_(stream)
      , threshold_(threshold)
    {
    }

    void log(log_level level, const std::string& message) override
    {
        if (level < threshold_)
            return;

        std::lock_guard<std::mutex> lock(mutex_);
        fmt::print(stream_, "{}{}\n", level_prefix(level), message);
        std::fflush(stream_);
    }

    log_level threshold() const { return threshold_; }
};

} // namespace chunkwise
