#include <chunkwise/events.hpp>
#include <chunkwise/errors.hpp>

#include <fmt/format.h>

#include <utility>

namespace chunkwise
{

// ============================================================================
// Formatting
// ============================================================================

std::string format_event(const chunk_update_event& event)
{
    return fmt::format("Chunk size update: {}, {:.3f}/{}s, {:.2f}/{:.2f} -> {}{}",
                       event.processed,
                       event.elapsed_seconds,
                       event.target_seconds,
                       event.observed_rate,
                       event.implied_rate_at_target,
                       event.new_estimate,
                       event.clamped ? " (clamped)" : "");
}

std::string format_event(const lag_pause_event& event)
{
    return fmt::format("Chunk detected lag of {}s on {}, pausing for {}us",
                       event.observed_lag,
                       event.label,
                       event.pause_duration.count());
}

std::string format_event(const lag_timeout_event& event)
{
    return fmt::format("Replica lag on {} did not recover after {}us paused (lag {}s), {}",
                       event.label,
                       event.total_paused.count(),
                       event.observed_lag,
                       event.continuing ? "continuing" : "aborting");
}

// ============================================================================
// logging_event_sink
// ============================================================================

logging_event_sink::logging_event_sink(std::shared_ptr<logger> log)
  : logger_(std::move(log))
{
    if (!logger_)
        throw usage_error("logging_event_sink requires a logger");
}

void logging_event_sink::on_chunk_update(const chunk_update_event& event)
{
    logger_->log(log_level::notice, format_event(event));
}

void logging_event_sink::on_lag_pause(const lag_pause_event& event)
{
    logger_->log(log_level::notice, format_event(event));
}

void logging_event_sink::on_lag_timeout(const lag_timeout_event& event)
{
    logger_->log(event.continuing ? log_level::warning : log_level::error, format_event(event));
}

// ============================================================================
// fanout_event_sink
// ============================================================================

fanout_event_sink::fanout_event_sink(std::vector<std::shared_ptr<event_sink>> sinks)
{
    for (auto& sink : sinks)
        add(std::move(sink));
}

void fanout_event_sink::add(std::shared_ptr<event_sink> sink)
{
    if (!sink)
        throw usage_error("Cannot add a null event sink");
    sinks_.push_back(std::move(sink));
}

void fanout_event_sink::on_chunk_update(const chunk_update_event& event)
{
    for (auto& sink : sinks_)
        sink->on_chunk_update(event);
}

void fanout_event_sink::on_lag_pause(const lag_pause_event& event)
{
    for (auto& sink : sinks_)
        sink->on_lag_pause(event);
}

void fanout_event_sink::on_lag_timeout(const lag_timeout_event& event)
{
    for (auto& sink : sinks_)
        sink->on_lag_timeout(event);
}

} // namespace chunkwise
