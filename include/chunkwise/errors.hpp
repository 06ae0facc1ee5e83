#pragma once

#include <fmt/format.h>

#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>

namespace chunkwise
{

// ============================================================================
// Error Types
// ============================================================================

// Caller broke the controller contract (bad elapsed time, unknown option,
// end() without begin(), ...). Not recoverable.
class usage_error : public std::logic_error
{
public:
    using std::logic_error::logic_error;
};

// A replica stayed above max_lag after the whole pause budget was spent.
class lag_timeout_error : public std::runtime_error
{
    std::string label_;
    double observed_lag_;
    std::chrono::microseconds total_paused_;

public:
    lag_timeout_error(std::string label, double observed_lag, std::chrono::microseconds total_paused)
      : std::runtime_error(fmt::format(
            "Replica lag did not recover after processing chunk ({} still {}s behind after {}us paused). Aborting.",
            label,
            observed_lag,
            total_paused.count()))
      , label_(std::move(label))
      , observed_lag_(observed_lag)
      , total_paused_(total_paused)
    {
    }

    const std::string& label() const noexcept { return label_; }
    double observed_lag() const noexcept { return observed_lag_; }
    std::chrono::microseconds total_paused() const noexcept { return total_paused_; }
};

// Unreadable or malformed configuration input.
class config_error : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

} // namespace chunkwise
