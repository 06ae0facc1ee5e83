#pragma once

#include <chunkwise/chunk_controller.hpp>
#include <chunkwise/errors.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace chunkwise
{

// ============================================================================
// Controller Builder
// ============================================================================

class controller_builder
{
    std::int64_t initial_estimate_{0};
    double target_seconds_{0.2};
    option_map options_;
    hook_preset preset_{hook_preset::fixed_pause};
    std::vector<std::shared_ptr<pacing_hook>> hooks_;
    std::optional<std::vector<std::shared_ptr<lag_source>>> sources_;
    std::shared_ptr<pacing_clock> clock_;
    std::vector<std::shared_ptr<event_sink>> sinks_;

public:
    controller_builder& with_initial_estimate(std::int64_t estimate)
    {
        initial_estimate_ = estimate;
        return *this;
    }

    controller_builder& with_target(double seconds)
    {
        target_seconds_ = seconds;
        return *this;
    }

    controller_builder& with_option(const std::string& name, option_value value)
    {
        options_[std::string(canonical_option_name(name))] = std::move(value);
        return *this;
    }

    controller_builder& with_options(const option_map& options)
    {
        for (const auto& [name, value] : options)
            with_option(name, value);
        return *this;
    }

    controller_builder& with_fixed_pause(std::chrono::microseconds delay)
    {
        preset_ = hook_preset::fixed_pause;
        options_["pause_always"] = static_cast<std::int64_t>(delay.count());
        return *this;
    }

    controller_builder& without_fixed_pause()
    {
        preset_ = hook_preset::none;
        return *this;
    }

    controller_builder& with_hook(std::shared_ptr<pacing_hook> hook)
    {
        hooks_.push_back(std::move(hook));
        return *this;
    }

    controller_builder& with_lag_sources(std::vector<std::shared_ptr<lag_source>> sources)
    {
        sources_ = std::move(sources);
        return *this;
    }

    controller_builder& with_clock(std::shared_ptr<pacing_clock> clock)
    {
        clock_ = std::move(clock);
        return *this;
    }

    controller_builder& with_event_sink(std::shared_ptr<event_sink> sink)
    {
        sinks_.push_back(std::move(sink));
        return *this;
    }

    controller_builder& with_logger(std::shared_ptr<logger> log)
    {
        sinks_.push_back(std::make_shared<logging_event_sink>(std::move(log)));
        return *this;
    }

    chunk_controller build() const
    {
        if (initial_estimate_ <= 0)
            throw usage_error{"controller_builder requires a positive initial estimate"};

        chunk_controller controller(initial_estimate_, target_seconds_, options_, preset_, clock_);

        for (const auto& hook : hooks_)
            controller.add_hook(hook);

        if (sources_)
            controller.set_sources(*sources_);

        if (sinks_.size() == 1)
            controller.set_event_sink(sinks_.front());
        else if (sinks_.size() > 1)
            controller.set_event_sink(std::make_shared<fanout_event_sink>(sinks_));

        return controller;
    }
};

} // namespace chunkwise
