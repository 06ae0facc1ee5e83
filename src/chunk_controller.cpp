#include <chunkwise/chunk_controller.hpp>
#include <chunkwise/errors.hpp>
#include <chunkwise/pause_gate.hpp>

#include <fmt/format.h>

namespace chunkwise
{

namespace
{

// Returns the controller to idle however pacing ends.
class idle_on_exit
{
    controller_phase& phase_;

public:
    explicit idle_on_exit(controller_phase& phase)
      : phase_(phase)
    {
    }

    idle_on_exit(const idle_on_exit&) = delete;
    idle_on_exit& operator=(const idle_on_exit&) = delete;

    ~idle_on_exit() { phase_ = controller_phase::idle; }
};

chunk_options merged_options(std::int64_t initial_estimate, const option_map& overrides)
{
    auto options = chunk_options::defaults_for(initial_estimate);
    options.merge(overrides);
    return options;
}

std::shared_ptr<event_sink> default_sink()
{
    static const auto sink = std::make_shared<null_event_sink>();
    return sink;
}

} // namespace

const char* to_string(controller_phase phase)
{
    switch (phase)
    {
        case controller_phase::idle:
            return "idle";
        case controller_phase::measuring:
            return "measuring";
        case controller_phase::updating:
            return "updating";
        case controller_phase::pacing:
            return "pacing";
    }
    return "unknown";
}

chunk_controller::chunk_controller(std::int64_t initial_estimate,
                                   double target_seconds,
                                   const option_map& overrides,
                                   hook_preset preset,
                                   std::shared_ptr<pacing_clock> clock)
  : estimator_(initial_estimate, target_seconds, merged_options(initial_estimate, overrides))
  , clock_(clock ? std::move(clock) : std::make_shared<steady_clock_source>())
  , events_(default_sink())
{
    if (preset == hook_preset::fixed_pause)
        hooks_.push_back(std::make_shared<pause_gate>());
}

void chunk_controller::begin()
{
    if (phase_ == controller_phase::updating || phase_ == controller_phase::pacing)
        throw usage_error(fmt::format("begin() called while {}", to_string(phase_)));

    estimator_.begin(clock_->now_seconds());
    phase_ = controller_phase::measuring;
}

void chunk_controller::end(std::optional<std::int64_t> processed)
{
    if (phase_ != controller_phase::measuring)
        throw usage_error(fmt::format("end() called while {} (missing begin()?)", to_string(phase_)));

    const double now = clock_->now_seconds();

    phase_ = controller_phase::updating;
    chunk_update_event event;
    try
    {
        event = estimator_.end(now, processed);
    }
    catch (...)
    {
        phase_ = controller_phase::measuring;
        throw;
    }

    pace(event);
}

void chunk_controller::interval(double elapsed_seconds, std::optional<std::int64_t> processed)
{
    if (phase_ == controller_phase::updating || phase_ == controller_phase::pacing)
        throw usage_error(fmt::format("interval() called while {}", to_string(phase_)));

    const auto previous = phase_;

    phase_ = controller_phase::updating;
    chunk_update_event event;
    try
    {
        event = estimator_.interval(elapsed_seconds, processed);
    }
    catch (...)
    {
        phase_ = previous;
        throw;
    }

    pace(event);
}

void chunk_controller::pace(const chunk_update_event& event)
{
    idle_on_exit guard(phase_);
    paused_ = false;

    events_->on_chunk_update(event);

    phase_ = controller_phase::pacing;

    pacing_context context{estimator_.options(), *clock_, *events_};
    try
    {
        for (const auto& hook : hooks_)
        {
            if (hook->after_update(context))
                paused_ = true;
        }
    }
    catch (const lag_timeout_error&)
    {
        paused_ = true;
        throw;
    }
}

void chunk_controller::require_reconfigurable(const char* operation) const
{
    if (phase_ == controller_phase::updating || phase_ == controller_phase::pacing)
        throw usage_error(fmt::format("{} called while {}", operation, to_string(phase_)));
}

void chunk_controller::set_option(std::string_view name, const option_value& value)
{
    require_reconfigurable("set_option()");
    estimator_.set_option(name, value);
}

void chunk_controller::set_sources(std::vector<std::shared_ptr<lag_source>> sources)
{
    require_reconfigurable("set_sources()");

    if (!lag_gate_)
    {
        auto gate = std::make_shared<lag_gate>(std::move(sources));
        hooks_.push_back(gate);
        lag_gate_ = std::move(gate);
        return;
    }

    lag_gate_->set_sources(std::move(sources));
}

void chunk_controller::add_hook(std::shared_ptr<pacing_hook> hook)
{
    require_reconfigurable("add_hook()");

    if (!hook)
        throw usage_error("Cannot register a null pacing hook");

    if (!lag_gate_)
    {
        if (auto gate = std::dynamic_pointer_cast<lag_gate>(hook))
            lag_gate_ = gate;
    }

    hooks_.push_back(std::move(hook));
}

void chunk_controller::set_event_sink(std::shared_ptr<event_sink> sink)
{
    require_reconfigurable("set_event_sink()");
    events_ = sink ? std::move(sink) : default_sink();
}

void chunk_controller::set_logger(std::shared_ptr<logger> log)
{
    if (!log)
    {
        set_event_sink(nullptr);
        return;
    }
    set_event_sink(std::make_shared<logging_event_sink>(std::move(log)));
}

void chunk_controller::set_clock(std::shared_ptr<pacing_clock> clock)
{
    require_reconfigurable("set_clock()");

    if (!clock)
        throw usage_error("Cannot use a null clock");

    if (phase_ == controller_phase::measuring)
        throw usage_error("set_clock() called while measuring");

    clock_ = std::move(clock);
}

} // namespace chunkwise
