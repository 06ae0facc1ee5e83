#include <chunkwise/rate_estimator.hpp>
#include <chunkwise/errors.hpp>

#include <fmt/format.h>

#include <cmath>
#include <utility>

namespace chunkwise
{

rate_estimator::rate_estimator(std::int64_t initial_estimate, double target_seconds, chunk_options options)
  : estimate_(initial_estimate)
  , target_seconds_(target_seconds)
  , average_rate_(0.0)
  , options_(std::move(options))
{
    if (initial_estimate <= 0)
        throw usage_error(fmt::format("Initial estimate must be positive, got {}", initial_estimate));

    if (!std::isfinite(target_seconds) || target_seconds <= 0.0)
        throw usage_error(fmt::format("Target duration must be positive, got {}s", target_seconds));

    if (!options_.is_valid())
        throw usage_error("Invalid chunk options");

    average_rate_ = static_cast<double>(initial_estimate) / target_seconds;
}

void rate_estimator::set_target(double seconds)
{
    if (!std::isfinite(seconds) || seconds <= 0.0)
        throw usage_error(fmt::format("Target duration must be positive, got {}s", seconds));

    target_seconds_ = seconds;
}

void rate_estimator::begin(double now_seconds)
{
    pending_begin_ = now_seconds;
}

chunk_update_event rate_estimator::end(double now_seconds, std::optional<std::int64_t> processed)
{
    if (!pending_begin_)
        throw usage_error("end() called without a matching begin()");

    auto event = update(now_seconds - *pending_begin_, processed);
    pending_begin_.reset();
    return event;
}

chunk_update_event rate_estimator::interval(double elapsed_seconds, std::optional<std::int64_t> processed)
{
    auto event = update(elapsed_seconds, processed);
    pending_begin_.reset();
    return event;
}

chunk_update_event rate_estimator::update(double elapsed_seconds, std::optional<std::int64_t> processed)
{
    // Everything is validated before the average is touched
    if (!std::isfinite(elapsed_seconds) || elapsed_seconds <= 0.0)
        throw usage_error(fmt::format("Elapsed time must be positive, got {}s", elapsed_seconds));

    const std::int64_t count = processed.value_or(estimate_);
    if (count < 0)
        throw usage_error(fmt::format("Processed count cannot be negative, got {}", count));

    if (options_.min > options_.max)
        throw usage_error(fmt::format("Option 'min' ({}) exceeds 'max' ({})", options_.min, options_.max));

    const double observed = static_cast<double>(count) / elapsed_seconds;
    if (!std::isfinite(observed))
        throw usage_error(fmt::format("Observed rate overflows for {} items in {}s", count, elapsed_seconds));

    average_rate_ = options_.smoothing * observed + (1.0 - options_.smoothing) * average_rate_;

    // Clamp in floating point so an extreme rate cannot overflow the integer
    const double raw = std::round(average_rate_ * target_seconds_);
    clamped_ = false;
    if (raw > static_cast<double>(options_.max))
    {
        estimate_ = options_.max;
        clamped_ = true;
    }
    else if (raw < static_cast<double>(options_.min))
    {
        estimate_ = options_.min;
        clamped_ = true;
    }
    else
    {
        estimate_ = static_cast<std::int64_t>(raw);
    }

    chunk_update_event event;
    event.processed = count;
    event.elapsed_seconds = elapsed_seconds;
    event.target_seconds = target_seconds_;
    event.observed_rate = observed;
    event.implied_rate_at_target = static_cast<double>(count) / target_seconds_;
    event.new_estimate = estimate_;
    event.clamped = clamped_;
    return event;
}

} // namespace chunkwise
