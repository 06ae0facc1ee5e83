#include <chunkwise/lag_gate.hpp>
#include <chunkwise/errors.hpp>

#include <cmath>
#include <utility>

namespace chunkwise
{

const char* to_string(lag_wait_state state)
{
    switch (state)
    {
        case lag_wait_state::polling:
            return "polling";
        case lag_wait_state::waiting:
            return "waiting";
        case lag_wait_state::cleared:
            return "cleared";
        case lag_wait_state::budget_exceeded:
            return "budget_exceeded";
    }
    return "unknown";
}

// ============================================================================
// lag_wait
// ============================================================================

lag_wait::lag_wait(lag_source& source, pacing_context& context)
  : source_(source)
  , context_(context)
  , label_(source.label())
{
}

lag_wait_state lag_wait::step()
{
    switch (state_)
    {
        case lag_wait_state::polling:
        {
            last_lag_ = source_.current_lag_seconds();
            if (last_lag_ && !std::isfinite(*last_lag_))
                last_lag_.reset();

            if (!last_lag_ || *last_lag_ <= context_.options.max_lag)
            {
                state_ = lag_wait_state::cleared;
            }
            else
            {
                paused_ = true;
                state_ = lag_wait_state::waiting;
            }
            break;
        }

        case lag_wait_state::waiting:
        {
            const auto interval = context_.options.pause_interval;
            context_.events.on_lag_pause(lag_pause_event{label_, last_lag_.value_or(0.0), interval});

            context_.clock.sleep_for(interval);
            total_paused_ += interval;

            state_ = total_paused_ > context_.options.max_total_pause
                       ? lag_wait_state::budget_exceeded
                       : lag_wait_state::polling;
            break;
        }

        case lag_wait_state::cleared:
        case lag_wait_state::budget_exceeded:
            break;
    }

    return state_;
}

lag_wait_state lag_wait::run()
{
    while (!done())
        step();
    return state_;
}

// ============================================================================
// lag_gate
// ============================================================================

lag_gate::lag_gate(std::vector<std::shared_ptr<lag_source>> sources)
{
    set_sources(std::move(sources));
}

void lag_gate::set_sources(std::vector<std::shared_ptr<lag_source>> sources)
{
    for (const auto& source : sources)
    {
        if (!source)
            throw usage_error("Lag sources cannot be null");
    }
    sources_ = std::move(sources);
}

bool lag_gate::after_update(pacing_context& context)
{
    bool paused = false;

    for (const auto& source : sources_)
    {
        lag_wait wait(*source, context);
        const auto outcome = wait.run();
        paused = paused || wait.paused();

        if (outcome != lag_wait_state::budget_exceeded)
            continue;

        const bool continuing = context.options.continue_on_timeout;
        const double lag = wait.last_lag().value_or(0.0);
        context.events.on_lag_timeout(lag_timeout_event{wait.label(), lag, wait.total_paused(), continuing});

        if (!continuing)
            throw lag_timeout_error(wait.label(), lag, wait.total_paused());
    }

    return paused;
}

} // namespace chunkwise
