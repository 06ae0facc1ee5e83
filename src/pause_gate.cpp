#include <chunkwise/pause_gate.hpp>

namespace chunkwise
{

bool pause_gate::after_update(pacing_context& context)
{
    const auto& delay = context.options.pause_always;
    if (!delay || delay->count() <= 0)
        return false;

    context.clock.sleep_for(*delay);
    return true;
}

} // namespace chunkwise
