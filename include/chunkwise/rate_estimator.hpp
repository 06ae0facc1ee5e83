#pragma once

#include <chunkwise/events.hpp>
#include <chunkwise/options.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

namespace chunkwise
{

// ============================================================================
// Rate Estimator
// ============================================================================

/**
 * @brief Exponentially weighted estimate of the chunk size that fits a target
 * wallclock duration.
 *
 * Each observation (items processed over elapsed seconds) is folded into an
 * EWMA of the processing rate; the recommendation is that rate times the
 * target duration, rounded and clamped to [min, max].
 *
 * When no processed count is reported the current estimate is assumed to have
 * been processed in full. A caller that silently processes fewer items will
 * see an inflated rate.
 *
 * @note Not thread-safe; one estimator per chunk loop.
 */
class rate_estimator
{
    std::int64_t estimate_;
    double target_seconds_;
    double average_rate_;
    std::optional<double> pending_begin_;
    bool clamped_{false};
    chunk_options options_;

public:
    /**
     * @param initial_estimate First recommended chunk size, must be positive
     * @param target_seconds Desired wallclock duration of one chunk, must be positive
     * @param options Tunables, usually chunk_options::defaults_for(initial_estimate)
     * @throws usage_error on invalid arguments
     */
    rate_estimator(std::int64_t initial_estimate, double target_seconds, chunk_options options);

    std::int64_t estimated_size() const { return estimate_; }
    double target_seconds() const { return target_seconds_; }
    double average_rate() const { return average_rate_; }
    bool clamped() const { return clamped_; }
    bool measuring() const { return pending_begin_.has_value(); }

    const chunk_options& options() const { return options_; }
    option_value get_option(std::string_view name) const { return options_.get(name); }
    void set_option(std::string_view name, const option_value& value) { options_.set(name, value); }

    // Applies to later updates only; the average rate is not rescaled.
    void set_target(double seconds);

    void begin(double now_seconds);

    /// Closes the window opened by begin() and updates the estimate.
    /// @throws usage_error without a prior begin() or with a non-positive window
    chunk_update_event end(double now_seconds, std::optional<std::int64_t> processed = std::nullopt);

    /// Updates the estimate from an explicitly measured duration. Any open
    /// begin() window is discarded.
    chunk_update_event interval(double elapsed_seconds, std::optional<std::int64_t> processed = std::nullopt);

private:
    chunk_update_event update(double elapsed_seconds, std::optional<std::int64_t> processed);
};

} // namespace chunkwise
