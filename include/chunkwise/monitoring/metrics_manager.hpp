// ============================================================================
// Prometheus metric creation helpers
// ============================================================================
#pragma once

#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace chunkwise::monitoring
{

using label_map = std::map<std::string, std::string>;

class metrics_manager
{
public:
    /// @param registry Registry the metrics are registered in; must not be null
    /// @param default_labels Labels added to every metric (e.g. {"job", "purge_orders"})
    /// @throws std::invalid_argument on a null registry or invalid label names
    explicit metrics_manager(std::shared_ptr<prometheus::Registry> registry, label_map default_labels = {});

    [[nodiscard]] const std::shared_ptr<prometheus::Registry>& registry() const { return registry_; }
    [[nodiscard]] const label_map& default_labels() const { return default_labels_; }

    /// Merge default labels with provided labels.
    /// Provided labels override defaults if keys conflict.
    [[nodiscard]] label_map merge_labels(const label_map& labels) const;

    [[nodiscard]] prometheus::Family<prometheus::Counter>& counter_family(const std::string& name, const std::string& help);
    [[nodiscard]] prometheus::Family<prometheus::Gauge>& gauge_family(const std::string& name, const std::string& help);
    [[nodiscard]] prometheus::Family<prometheus::Histogram>& histogram_family(const std::string& name, const std::string& help);

    /// @return Reference valid until the registry is destroyed
    [[nodiscard]] prometheus::Counter& add_counter(prometheus::Family<prometheus::Counter>& family,
                                                   const label_map& labels = {});
    [[nodiscard]] prometheus::Gauge& add_gauge(prometheus::Family<prometheus::Gauge>& family,
                                               const label_map& labels = {});
    [[nodiscard]] prometheus::Histogram& add_histogram(prometheus::Family<prometheus::Histogram>& family,
                                                       const std::vector<double>& buckets,
                                                       const label_map& labels = {});

    /// Must match [a-zA-Z_:][a-zA-Z0-9_:]* and not start with __
    static void validate_metric_name(const std::string& name);
    static void validate_labels(const label_map& labels);
    [[nodiscard]] static bool validate_label_value(const std::string& value);

private:
    std::shared_ptr<prometheus::Registry> registry_;
    label_map default_labels_;
};

} // namespace chunkwise::monitoring
