#include <chunkwise/options.hpp>
#include <chunkwise/errors.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <type_traits>
#include <utility>

namespace chunkwise
{

namespace
{

constexpr std::pair<std::string_view, std::string_view> option_aliases[] = {
    {"pause",         "pause_interval"     },
    {"max_pause",     "max_total_pause"    },
    {"max_pause_lag", "max_total_pause"    },
    {"continue",      "continue_on_timeout"},
    {"continue_lag",  "continue_on_timeout"},
};

std::int64_t as_integer(std::string_view name, const option_value& value)
{
    if (auto integer = std::get_if<std::int64_t>(&value))
        return *integer;

    if (auto number = std::get_if<double>(&value))
    {
        if (std::isfinite(*number) && std::trunc(*number) == *number)
            return static_cast<std::int64_t>(*number);
    }

    throw usage_error(fmt::format("Option '{}' expects an integer, got {}", name, to_string(value)));
}

double as_number(std::string_view name, const option_value& value)
{
    if (auto integer = std::get_if<std::int64_t>(&value))
        return static_cast<double>(*integer);

    if (auto number = std::get_if<double>(&value); number && std::isfinite(*number))
        return *number;

    throw usage_error(fmt::format("Option '{}' expects a number, got {}", name, to_string(value)));
}

bool as_bool(std::string_view name, const option_value& value)
{
    if (auto flag = std::get_if<bool>(&value))
        return *flag;

    throw usage_error(fmt::format("Option '{}' expects a boolean, got {}", name, to_string(value)));
}

void require(bool condition, std::string_view name, std::string_view constraint)
{
    if (!condition)
        throw usage_error(fmt::format("Option '{}' must be {}", name, constraint));
}

} // namespace

std::string to_string(const option_value& value)
{
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>)
                return "null";
            else if constexpr (std::is_same_v<T, bool>)
                return v ? "true" : "false";
            else
                return fmt::format("{}", v);
        },
        value);
}

const std::vector<std::string_view>& option_names()
{
    static const std::vector<std::string_view> names = {
        "min",
        "max",
        "smoothing",
        "pause_always",
        "max_lag",
        "pause_interval",
        "max_total_pause",
        "continue_on_timeout",
    };
    return names;
}

std::string_view canonical_option_name(std::string_view name)
{
    const auto& names = option_names();
    auto it = std::find(names.begin(), names.end(), name);
    if (it != names.end())
        return *it;

    for (const auto& [alias, canonical] : option_aliases)
    {
        if (alias == name)
            return canonical;
    }

    throw usage_error(fmt::format("Unknown option '{}'", name));
}

chunk_options chunk_options::defaults_for(std::int64_t initial_estimate)
{
    chunk_options options;
    options.min = static_cast<std::int64_t>(0.01 * static_cast<double>(initial_estimate));
    options.max = std::max<std::int64_t>(options.min, 3 * initial_estimate);
    return options;
}

option_value chunk_options::get(std::string_view name) const
{
    const auto canonical = canonical_option_name(name);

    if (canonical == "min")
        return min;
    if (canonical == "max")
        return max;
    if (canonical == "smoothing")
        return smoothing;
    if (canonical == "pause_always")
    {
        if (!pause_always)
            return std::monostate{};
        return static_cast<std::int64_t>(pause_always->count());
    }
    if (canonical == "max_lag")
        return max_lag;
    if (canonical == "pause_interval")
        return static_cast<std::int64_t>(pause_interval.count());
    if (canonical == "max_total_pause")
        return static_cast<std::int64_t>(max_total_pause.count());

    return continue_on_timeout;
}

void chunk_options::set(std::string_view name, const option_value& value)
{
    const auto canonical = canonical_option_name(name);

    if (canonical == "min")
    {
        auto v = as_integer(canonical, value);
        require(v >= 0, canonical, "non-negative");
        min = v;
    }
    else if (canonical == "max")
    {
        auto v = as_integer(canonical, value);
        require(v >= 1, canonical, "at least 1");
        max = v;
    }
    else if (canonical == "smoothing")
    {
        auto v = as_number(canonical, value);
        require(v > 0.0 && v < 1.0, canonical, "strictly between 0 and 1");
        smoothing = v;
    }
    else if (canonical == "pause_always")
    {
        if (std::holds_alternative<std::monostate>(value))
        {
            pause_always.reset();
            return;
        }
        auto v = as_integer(canonical, value);
        require(v >= 0, canonical, "a non-negative number of microseconds");
        pause_always = std::chrono::microseconds(v);
    }
    else if (canonical == "max_lag")
    {
        auto v = as_number(canonical, value);
        require(v >= 0.0, canonical, "a non-negative number of seconds");
        max_lag = v;
    }
    else if (canonical == "pause_interval")
    {
        auto v = as_integer(canonical, value);
        require(v > 0, canonical, "a positive number of microseconds");
        pause_interval = std::chrono::microseconds(v);
    }
    else if (canonical == "max_total_pause")
    {
        auto v = as_integer(canonical, value);
        require(v >= 0, canonical, "a non-negative number of microseconds");
        max_total_pause = std::chrono::microseconds(v);
    }
    else
    {
        continue_on_timeout = as_bool(canonical, value);
    }
}

void chunk_options::merge(const option_map& overrides)
{
    for (const auto& [name, value] : overrides)
        set(name, value);
}

} // namespace chunkwise
