#include <chunkwise/chunkwise.h>

#include <fmt/core.h>
#include <prometheus/registry.h>
#include <prometheus/text_serializer.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <thread>

using namespace chunkwise;

// Replica that falls behind while the primary is busy and catches up while
// the caller is paused.
class simulated_replica
{
    double lag_{0.0};

public:
    void apply(std::int64_t rows) { lag_ += static_cast<double>(rows) / 400.0; }
    void catch_up() { lag_ = std::max(0.0, lag_ - 0.8); }

    std::optional<double> lag() const { return lag_; }
};

int main(int argc, char** argv)
{
    const std::string path = argc > 1 ? argv[1] : "examples/chunkwise.yaml";

    config::controller_settings settings;
    try
    {
        settings = config::load_settings_file(path);
        config::apply_environment(settings.options);
    }
    catch (const config_error& e)
    {
        fmt::print(stderr, "Configuration error: {}\n", e.what());
        return 1;
    }

    auto registry = std::make_shared<prometheus::Registry>();
    auto metrics = std::make_shared<monitoring::chunk_metrics>(registry, monitoring::label_map{{"job", "replicated_update"}});
    auto log = std::make_shared<console_logger>(stderr, log_level::notice);

    simulated_replica replica;
    auto source = std::make_shared<callback_lag_source>("replica-1", [&replica]() {
        auto lag = replica.lag();
        replica.catch_up();
        return lag;
    });

    auto chunk = controller_builder()
                   .with_initial_estimate(settings.initial_estimate)
                   .with_target(settings.target_seconds)
                   .with_options(settings.options)
                   .with_lag_sources({source})
                   .with_event_sink(metrics)
                   .with_logger(log)
                   .build();

    std::int64_t remaining = 5000;
    try
    {
        while (remaining > 0)
        {
            run_chunk(chunk, [&](std::int64_t size) {
                const auto count = std::min(size, remaining);
                std::this_thread::sleep_for(std::chrono::microseconds(count * 100));
                replica.apply(count);
                remaining -= count;
                return count;
            });
        }
    }
    catch (const lag_timeout_error& e)
    {
        fmt::print(stderr, "{}\n", e.what());
        return 2;
    }

    prometheus::TextSerializer serializer;
    fmt::print("{}", serializer.Serialize(registry->Collect()));
    return 0;
}
