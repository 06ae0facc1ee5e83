#pragma once

#include <chunkwise/logger.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace chunkwise
{

// ============================================================================
// Diagnostic Events
// ============================================================================

struct chunk_update_event
{
    std::int64_t processed{0};
    double elapsed_seconds{0.0};
    double target_seconds{0.0};
    double observed_rate{0.0};
    // Rate the previous chunk would have needed to finish exactly on target.
    double implied_rate_at_target{0.0};
    std::int64_t new_estimate{0};
    bool clamped{false};
};

struct lag_pause_event
{
    std::string label;
    double observed_lag{0.0};
    std::chrono::microseconds pause_duration{0};
};

struct lag_timeout_event
{
    std::string label;
    double observed_lag{0.0};
    std::chrono::microseconds total_paused{0};
    bool continuing{false};
};

std::string format_event(const chunk_update_event& event);
std::string format_event(const lag_pause_event& event);
std::string format_event(const lag_timeout_event& event);

// ============================================================================
// Event Sink Interface
// ============================================================================

class event_sink
{
public:
    virtual ~event_sink() = default;
    virtual void on_chunk_update(const chunk_update_event& event) = 0;
    virtual void on_lag_pause(const lag_pause_event& event) = 0;
    virtual void on_lag_timeout(const lag_timeout_event& event) = 0;
};

// ============================================================================
// Built-in Implementations
// ============================================================================

class null_event_sink : public event_sink
{
public:
    void on_chunk_update(const chunk_update_event&) override {}
    void on_lag_pause(const lag_pause_event&) override {}
    void on_lag_timeout(const lag_timeout_event&) override {}
};

// Renders events as log lines: updates and pauses at notice level, timeouts
// at warning (continuing) or error (aborting).
class logging_event_sink : public event_sink
{
    std::shared_ptr<logger> logger_;

public:
    explicit logging_event_sink(std::shared_ptr<logger> log);

    void on_chunk_update(const chunk_update_event& event) override;
    void on_lag_pause(const lag_pause_event& event) override;
    void on_lag_timeout(const lag_timeout_event& event) override;
};

class fanout_event_sink : public event_sink
{
    std::vector<std::shared_ptr<event_sink>> sinks_;

public:
    fanout_event_sink() = default;
    explicit fanout_event_sink(std::vector<std::shared_ptr<event_sink>> sinks);

    void add(std::shared_ptr<event_sink> sink);
    size_t size() const { return sinks_.size(); }

    void on_chunk_update(const chunk_update_event& event) override;
    void on_lag_pause(const lag_pause_event& event) override;
    void on_lag_timeout(const lag_timeout_event& event) override;
};

} // namespace chunkwise
