#pragma once

#include <chunkwise/clock.hpp>
#include <chunkwise/events.hpp>
#include <chunkwise/lag_gate.hpp>
#include <chunkwise/logger.hpp>
#include <chunkwise/options.hpp>
#include <chunkwise/pacing_hook.hpp>
#include <chunkwise/rate_estimator.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace chunkwise
{

enum class controller_phase
{
    idle,
    measuring,
    updating,
    pacing
};

const char* to_string(controller_phase phase);

// Hooks registered at construction.
enum class hook_preset
{
    none,
    fixed_pause
};

// ============================================================================
// Chunk Controller
// ============================================================================

/**
 * @brief Recommends chunk sizes for a sequential segmented operation and
 * paces it.
 *
 * Typical loop:
 * @code
 *   chunkwise::chunk_controller chunk(500, 0.2);
 *   while (more_rows)
 *   {
 *       chunk.begin();
 *       auto done = delete_rows(chunk.estimated_size());
 *       chunk.end(done);
 *   }
 * @endcode
 *
 * After each update the registered pacing hooks run in registration order
 * and may block the caller. A lag_timeout_error thrown by a hook propagates
 * out of end()/interval() and should stop the loop.
 *
 * @note Not thread-safe. Use one controller per chunk loop.
 */
class chunk_controller
{
    rate_estimator estimator_;
    std::vector<std::shared_ptr<pacing_hook>> hooks_;
    std::shared_ptr<lag_gate> lag_gate_;
    std::shared_ptr<pacing_clock> clock_;
    std::shared_ptr<event_sink> events_;
    controller_phase phase_{controller_phase::idle};
    bool paused_{false};

public:
    /**
     * @param initial_estimate First recommended chunk size, must be positive
     * @param target_seconds Desired wallclock duration of one chunk
     * @param overrides Options merged over chunk_options::defaults_for(initial_estimate)
     * @param preset fixed_pause registers a pause_gate (driven by the pause_always option)
     * @param clock Time source and sleeper; defaults to the steady clock
     * @throws usage_error on invalid arguments or options
     */
    explicit chunk_controller(std::int64_t initial_estimate,
                              double target_seconds = 0.2,
                              const option_map& overrides = {},
                              hook_preset preset = hook_preset::fixed_pause,
                              std::shared_ptr<pacing_clock> clock = nullptr);

    chunk_controller(const chunk_controller&) = delete;
    chunk_controller& operator=(const chunk_controller&) = delete;
    chunk_controller(chunk_controller&&) = default;
    chunk_controller& operator=(chunk_controller&&) = default;
    ~chunk_controller() = default;

    std::int64_t estimated_size() const { return estimator_.estimated_size(); }

    // Marks the start of a chunk. Calling it again restarts the window.
    void begin();

    // Marks the end of a chunk; processed defaults to the current estimate.
    void end(std::optional<std::int64_t> processed = std::nullopt);

    // Same as begin()+end() with an externally measured duration.
    void interval(double elapsed_seconds, std::optional<std::int64_t> processed = std::nullopt);

    void set_target(double seconds) { estimator_.set_target(seconds); }
    double target_seconds() const { return estimator_.target_seconds(); }
    double average_rate() const { return estimator_.average_rate(); }
    bool clamped() const { return estimator_.clamped(); }

    // Whether any hook blocked during the most recent update.
    bool paused() const { return paused_; }
    controller_phase phase() const { return phase_; }

    option_value get_option(std::string_view name) const { return estimator_.get_option(name); }
    void set_option(std::string_view name, const option_value& value);
    const chunk_options& options() const { return estimator_.options(); }

    // Replaces the replica lag sources, registering a lag_gate on first use.
    void set_sources(std::vector<std::shared_ptr<lag_source>> sources);

    void add_hook(std::shared_ptr<pacing_hook> hook);
    size_t hook_count() const { return hooks_.size(); }

    // nullptr restores the no-op sink.
    void set_event_sink(std::shared_ptr<event_sink> sink);

    // Shorthand for set_event_sink(logging_event_sink(log)).
    void set_logger(std::shared_ptr<logger> log);

    void set_clock(std::shared_ptr<pacing_clock> clock);

private:
    void require_reconfigurable(const char* operation) const;
    void pace(const chunk_update_event& event);
};

/// Runs one chunk of caller work between begin() and end().
/// @param work Callable taking the recommended size and returning the number of items processed
/// @return Items processed, as returned by work
template <typename Work>
std::int64_t run_chunk(chunk_controller& controller, Work&& work)
{
    const std::int64_t size = controller.estimated_size();
    controller.begin();
    const std::int64_t processed = std::forward<Work>(work)(size);
    controller.end(processed);
    return processed;
}

} // namespace chunkwise
