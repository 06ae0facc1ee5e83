#include <chunkwise/monitoring/chunk_metrics.hpp>

#include <chrono>
#include <utility>

namespace chunkwise::monitoring
{

namespace
{

const std::vector<double>& duration_buckets()
{
    static const std::vector<double> buckets = {0.01, 0.05, 0.1, 0.2, 0.5, 1.0, 2.0, 5.0, 10.0};
    return buckets;
}

} // namespace

chunk_metrics::chunk_metrics(std::shared_ptr<prometheus::Registry> registry, label_map labels)
    : manager_(std::move(registry), std::move(labels)),
      estimate_(manager_.add_gauge(
        manager_.gauge_family("chunkwise_chunk_estimate", "Current recommended chunk size")
      )),
      observed_rate_(manager_.add_gauge(
        manager_.gauge_family("chunkwise_observed_rate", "Items per second observed on the last chunk")
      )),
      updates_(manager_.add_counter(
        manager_.counter_family("chunkwise_chunk_updates_total", "Chunk estimate updates")
      )),
      clamped_(manager_.add_counter(
        manager_.counter_family("chunkwise_chunk_clamped_total", "Updates whose estimate was clamped")
      )),
      duration_(manager_.add_histogram(
        manager_.histogram_family("chunkwise_chunk_duration_seconds", "Wallclock duration of each chunk"),
        duration_buckets()
      )),
      lag_pauses_(manager_.counter_family("chunkwise_lag_pauses_total", "Sleeps caused by replica lag")),
      lag_pause_seconds_(manager_.counter_family("chunkwise_lag_pause_seconds_total", "Seconds slept waiting on replica lag")),
      lag_timeouts_(manager_.counter_family("chunkwise_lag_timeouts_total", "Replica lag waits that exhausted their budget"))
{
}

void chunk_metrics::on_chunk_update(const chunk_update_event& event)
{
    estimate_.Set(static_cast<double>(event.new_estimate));
    observed_rate_.Set(event.observed_rate);
    updates_.Increment();
    if (event.clamped)
    {
        clamped_.Increment();
    }
    duration_.Observe(event.elapsed_seconds);
}

void chunk_metrics::on_lag_pause(const lag_pause_event& event)
{
    const label_map source {{"source", event.label}};
    manager_.add_counter(lag_pauses_, source).Increment();
    manager_.add_counter(lag_pause_seconds_, source)
      .Increment(std::chrono::duration<double>(event.pause_duration).count());
}

void chunk_metrics::on_lag_timeout(const lag_timeout_event& event)
{
    manager_.add_counter(lag_timeouts_, {{"source", event.label}}).Increment();
}

} // namespace chunkwise::monitoring
