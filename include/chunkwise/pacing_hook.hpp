#pragma once

#include <chunkwise/clock.hpp>
#include <chunkwise/events.hpp>
#include <chunkwise/options.hpp>

namespace chunkwise
{

// ============================================================================
// Pacing Hook Interface
// ============================================================================

// What a hook sees while it runs: the live options, the clock to sleep on
// and the sink for diagnostics.
struct pacing_context
{
    const chunk_options& options;
    pacing_clock& clock;
    event_sink& events;
};

class pacing_hook
{
public:
    virtual ~pacing_hook() = default;

    // Runs after every estimate update, on the caller's thread. Returns true
    // when it blocked the caller. May throw lag_timeout_error.
    virtual bool after_update(pacing_context& context) = 0;
};

} // namespace chunkwise
