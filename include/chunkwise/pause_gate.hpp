#pragma once

#include <chunkwise/pacing_hook.hpp>

namespace chunkwise
{

// Sleeps for options.pause_always after every update. A no-op while the
// option is unset or zero.
class pause_gate : public pacing_hook
{
public:
    bool after_update(pacing_context& context) override;
};

} // namespace chunkwise
