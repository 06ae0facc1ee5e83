#pragma once

#include <chunkwise/options.hpp>

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace chunkwise::config
{

// Everything needed to construct a chunk_controller from a config file.
struct controller_settings
{
    std::int64_t initial_estimate{0};
    double target_seconds{0.2};
    option_map options;
};

/**
 * Reads option overrides from a YAML mapping such as
 *
 *   max_lag: 2
 *   pause_interval: 250000
 *   continue_on_timeout: true
 *   pause_always: ~
 *
 * Keys may be canonical names or aliases; they are stored canonical.
 * @throws config_error on unknown keys or non-scalar values
 */
option_map load_options(const YAML::Node& node);

/**
 * Reads a document with a top-level "chunkwise" mapping:
 *
 *   chunkwise:
 *     initial: 500
 *     target: 0.2
 *     options: { max_lag: 2 }
 *
 * Values are validated against chunk_options before returning.
 * @throws config_error on malformed or invalid settings
 */
controller_settings load_settings(const YAML::Node& root);

controller_settings load_settings_file(const std::string& path);

// Applies CHUNKWISE_<NAME> environment overrides (e.g. CHUNKWISE_MAX_LAG=3)
// on top of the given options.
void apply_environment(option_map& options, std::string_view prefix = "CHUNKWISE_");

// Parses an option value written as text ("true", "250000", "0.5", "null").
std::optional<option_value> parse_option_value(std::string_view text);

} // namespace chunkwise::config
