#include <chunkwise/monitoring/metrics_manager.hpp>

#include <regex>
#include <stdexcept>
#include <utility>

namespace chunkwise::monitoring
{

metrics_manager::metrics_manager(std::shared_ptr<prometheus::Registry> registry, label_map default_labels)
    : registry_(std::move(registry)), default_labels_(std::move(default_labels))
{
    if (!registry_)
    {
        throw std::invalid_argument("Registry cannot be null");
    }
    validate_labels(default_labels_);
}

label_map metrics_manager::merge_labels(const label_map& labels) const
{
    auto merged = default_labels_;
    for (const auto& [key, value]: labels)
    {
        merged[key] = value;
    }
    return merged;
}

prometheus::Family<prometheus::Counter>&
  metrics_manager::counter_family(const std::string& name, const std::string& help)
{
    validate_metric_name(name);
    return prometheus::BuildCounter().Name(name).Help(help).Register(*registry_);
}

prometheus::Family<prometheus::Gauge>&
  metrics_manager::gauge_family(const std::string& name, const std::string& help)
{
    validate_metric_name(name);
    return prometheus::BuildGauge().Name(name).Help(help).Register(*registry_);
}

prometheus::Family<prometheus::Histogram>&
  metrics_manager::histogram_family(const std::string& name, const std::string& help)
{
    validate_metric_name(name);
    return prometheus::BuildHistogram().Name(name).Help(help).Register(*registry_);
}

prometheus::Counter& metrics_manager::add_counter(
  prometheus::Family<prometheus::Counter>& family, const label_map& labels
)
{
    validate_labels(labels);
    return family.Add(merge_labels(labels));
}

prometheus::Gauge& metrics_manager::add_gauge(
  prometheus::Family<prometheus::Gauge>& family, const label_map& labels
)
{
    validate_labels(labels);
    return family.Add(merge_labels(labels));
}

prometheus::Histogram& metrics_manager::add_histogram(
  prometheus::Family<prometheus::Histogram>& family,
  const std::vector<double>& buckets, const label_map& labels
)
{
    validate_labels(labels);
    return family.Add(merge_labels(labels), buckets);
}

void metrics_manager::validate_metric_name(const std::string& name)
{
    if (name.empty())
    {
        throw std::invalid_argument("Metric name cannot be empty");
    }
    if (name.size() >= 2 && name[0] == '_' && name[1] == '_')
    {
        throw std::invalid_argument(
          "Metric name '" + name + "' cannot start with '__' (reserved prefix)"
        );
    }

    static const std::regex name_regex("^[a-zA-Z_:][a-zA-Z0-9_:]*$");
    if (!std::regex_match(name, name_regex))
    {
        throw std::invalid_argument(
          "Invalid metric name '" + name + "'. Must match [a-zA-Z_:][a-zA-Z0-9_:]*"
        );
    }
}

void metrics_manager::validate_labels(const label_map& labels)
{
    static const std::regex label_regex("^[a-zA-Z_][a-zA-Z0-9_]*$");

    for (const auto& [key, value]: labels)
    {
        if (key.size() >= 2 && key[0] == '_' && key[1] == '_')
        {
            throw std::invalid_argument(
              "Label name '" + key + "' cannot start with '__' (reserved prefix)"
            );
        }
        if (!std::regex_match(key, label_regex))
        {
            throw std::invalid_argument(
              "Invalid label name '" + key + "'. Must match [a-zA-Z_][a-zA-Z0-9_]*"
            );
        }
        if (!validate_label_value(value))
        {
            throw std::invalid_argument(
              "Label value for '" + key + "' contains invalid characters"
            );
        }
    }
}

bool metrics_manager::validate_label_value(const std::string& value)
{
    for (char c: value)
    {
        if (c < 32 && c != '\t')
        { // Reject control chars except tab
            return false;
        }
    }
    return true;
}

} // namespace chunkwise::monitoring
