#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace chunkwise
{

// ============================================================================
// Lag Source Interface
// ============================================================================

class lag_source
{
public:
    virtual ~lag_source() = default;

    // Human readable name used in diagnostics, e.g. "db2.example/orders".
    virtual std::string label() const = 0;

    // Current replication lag in seconds. Empty when the source has no lag
    // metric (not a replica), which never counts as lagging.
    virtual std::optional<double> current_lag_seconds() = 0;
};

// ============================================================================
// Built-in Implementations
// ============================================================================

class callback_lag_source : public lag_source
{
public:
    using poll_fn = std::function<std::optional<double>()>;

private:
    std::string label_;
    poll_fn poll_;

public:
    callback_lag_source(std::string label, poll_fn poll);

    std::string label() const override { return label_; }
    std::optional<double> current_lag_seconds() override { return poll_(); }
};

class fixed_lag_source : public lag_source
{
    std::string label_;
    std::optional<double> lag_;

public:
    fixed_lag_source(std::string label, std::optional<double> lag)
      : label_(std::move(label))
      , lag_(lag)
    {
    }

    void set_lag(std::optional<double> lag) { lag_ = lag; }

    std::string label() const override { return label_; }
    std::optional<double> current_lag_seconds() override { return lag_; }
};

/**
 * @brief Lag read from a replica status row (SHOW SLAVE STATUS / SHOW REPLICA STATUS).
 *
 * The fetcher runs the status query on the caller's connection and returns
 * the row as column -> value. An empty row, or a missing or NULL
 * Seconds_Behind_Master / Seconds_Behind_Source column, means the server is
 * not replicating.
 */
class replica_status_lag_source : public lag_source
{
public:
    using status_row = std::map<std::string, std::string>;
    using fetch_fn = std::function<status_row()>;

private:
    std::string label_;
    fetch_fn fetch_;

public:
    replica_status_lag_source(std::string label, fetch_fn fetch);

    std::string label() const override { return label_; }
    std::optional<double> current_lag_seconds() override { return parse_lag(fetch_()); }

    // Whole seconds behind the primary, fractional input is truncated.
    static std::optional<double> parse_lag(const status_row& row);
};

} // namespace chunkwise
