#pragma once

#include <chrono>
#include <thread>

namespace chunkwise
{

// ============================================================================
// Pacing Clock
// ============================================================================

// Time source and blocking sleep used by the controller and its hooks.
// Swapped for a manual clock in tests.
class pacing_clock
{
public:
    virtual ~pacing_clock() = default;

    // Monotonic seconds since an arbitrary epoch.
    virtual double now_seconds() = 0;

    virtual void sleep_for(std::chrono::microseconds duration) = 0;
};

class steady_clock_source : public pacing_clock
{
public:
    double now_seconds() override
    {
        auto since_epoch = std::chrono::steady_clock::now().time_since_epoch();
        return std::chrono::duration<double>(since_epoch).count();
    }

    void sleep_for(std::chrono::microseconds duration) override
    {
        if (duration.count() > 0)
            std::this_thread::sleep_for(duration);
    }
};

} // namespace chunkwise
