#pragma once

#include <chunkwise/lag_source.hpp>
#include <chunkwise/pacing_hook.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace chunkwise
{

// ============================================================================
// Per-source Lag Wait
// ============================================================================

enum class lag_wait_state
{
    polling,
    waiting,
    cleared,
    budget_exceeded
};

const char* to_string(lag_wait_state state);

/**
 * @brief Wait-and-recheck loop for a single lag source, one transition per step().
 *
 *   polling -> cleared          lag unknown, not finite or <= max_lag
 *   polling -> waiting          lag > max_lag
 *   waiting -> polling          slept pause_interval, budget left
 *   waiting -> budget_exceeded  total pause now exceeds max_total_pause
 *
 * The pause budget starts at zero for every wait.
 */
class lag_wait
{
    lag_source& source_;
    pacing_context& context_;
    std::string label_;
    lag_wait_state state_{lag_wait_state::polling};
    std::optional<double> last_lag_;
    std::chrono::microseconds total_paused_{0};
    bool paused_{false};

public:
    lag_wait(lag_source& source, pacing_context& context);

    lag_wait(const lag_wait&) = delete;
    lag_wait& operator=(const lag_wait&) = delete;

    lag_wait_state state() const { return state_; }
    bool done() const
    {
        return state_ == lag_wait_state::cleared || state_ == lag_wait_state::budget_exceeded;
    }

    const std::string& label() const { return label_; }
    bool paused() const { return paused_; }
    std::optional<double> last_lag() const { return last_lag_; }
    std::chrono::microseconds total_paused() const { return total_paused_; }

    // Performs one transition. A no-op once done().
    lag_wait_state step();

    // Steps until done() and returns the terminal state.
    lag_wait_state run();
};

// ============================================================================
// Lag Gate
// ============================================================================

// Resolves every lag source in order after each update. A source that
// stays lagged past its budget is skipped when continue_on_timeout is set and
// raises lag_timeout_error otherwise.
class lag_gate : public pacing_hook
{
    std::vector<std::shared_ptr<lag_source>> sources_;

public:
    lag_gate() = default;
    explicit lag_gate(std::vector<std::shared_ptr<lag_source>> sources);

    // Replaces the configured sources; their order is the polling order.
    void set_sources(std::vector<std::shared_ptr<lag_source>> sources);
    const std::vector<std::shared_ptr<lag_source>>& sources() const { return sources_; }

    bool after_update(pacing_context& context) override;
};

} // namespace chunkwise
