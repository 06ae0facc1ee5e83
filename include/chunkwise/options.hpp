#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace chunkwise
{

using option_value = std::variant<std::monostate, bool, std::int64_t, double>;
using option_map = std::map<std::string, option_value>;

std::string to_string(const option_value& value);

// Maps an accepted option name (canonical or alias) to its canonical name.
// Throws usage_error for unknown names.
std::string_view canonical_option_name(std::string_view name);

const std::vector<std::string_view>& option_names();

// ============================================================================
// Chunk Options
// ============================================================================

struct chunk_options
{
    // Estimate clamp bounds
    std::int64_t min{1};
    std::int64_t max{1};

    // EWMA weight of the newest observation, 0 < smoothing < 1
    double smoothing{0.3};

    // Fixed sleep after every update; unset or zero disables it
    std::optional<std::chrono::microseconds> pause_always;

    // Replica lag pacing
    double max_lag{1.0};
    std::chrono::microseconds pause_interval{500000};
    std::chrono::microseconds max_total_pause{60000000};
    bool continue_on_timeout{false};

    // min = 1% (truncated) and max = 300% of the initial estimate.
    static chunk_options defaults_for(std::int64_t initial_estimate);

    bool is_valid() const
    {
        return min >= 0 &&
               max >= 1 &&
               min <= max &&
               smoothing > 0.0 && smoothing < 1.0 &&
               (!pause_always || pause_always->count() >= 0) &&
               max_lag >= 0.0 &&
               pause_interval.count() > 0 &&
               max_total_pause.count() >= 0;
    }

    option_value get(std::string_view name) const;

    // Throws usage_error on unknown names, wrong types and out-of-range values.
    void set(std::string_view name, const option_value& value);

    void merge(const option_map& overrides);
};

} // namespace chunkwise
