#pragma once

#include <chunkwise/events.hpp>
#include <chunkwise/monitoring/metrics_manager.hpp>

#include <memory>

namespace chunkwise::monitoring
{

/**
 * @brief event_sink that exports controller activity as Prometheus metrics.
 *
 * Registered families:
 * - chunkwise_chunk_estimate (gauge)
 * - chunkwise_observed_rate (gauge, items/second of the last chunk)
 * - chunkwise_chunk_updates_total, chunkwise_chunk_clamped_total (counters)
 * - chunkwise_chunk_duration_seconds (histogram)
 * - chunkwise_lag_pauses_total, chunkwise_lag_pause_seconds_total,
 *   chunkwise_lag_timeouts_total (counters, labelled by source)
 */
class chunk_metrics : public event_sink
{
public:
    explicit chunk_metrics(std::shared_ptr<prometheus::Registry> registry, label_map labels = {});

    void on_chunk_update(const chunk_update_event& event) override;
    void on_lag_pause(const lag_pause_event& event) override;
    void on_lag_timeout(const lag_timeout_event& event) override;

    [[nodiscard]] const metrics_manager& manager() const { return manager_; }

private:
    metrics_manager manager_;

    prometheus::Gauge& estimate_;
    prometheus::Gauge& observed_rate_;
    prometheus::Counter& updates_;
    prometheus::Counter& clamped_;
    prometheus::Histogram& duration_;

    prometheus::Family<prometheus::Counter>& lag_pauses_;
    prometheus::Family<prometheus::Counter>& lag_pause_seconds_;
    prometheus::Family<prometheus::Counter>& lag_timeouts_;
};

} // namespace chunkwise::monitoring
