#include <chunkwise/config.hpp>
#include <chunkwise/errors.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <string>
#include <variant>

namespace chunkwise::config
{

namespace
{

std::string lowercase(std::string_view text)
{
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return std::tolower(c); });
    return out;
}

std::string uppercase(std::string_view text)
{
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return std::toupper(c); });
    return out;
}

option_value yaml_to_option(const std::string& name, const YAML::Node& node)
{
    if (node.IsNull())
        return std::monostate{};

    if (!node.IsScalar())
        throw config_error(fmt::format("Option '{}' must be a scalar", name));

    std::int64_t integer = 0;
    if (YAML::convert<std::int64_t>::decode(node, integer))
        return integer;

    double number = 0.0;
    if (YAML::convert<double>::decode(node, number))
        return number;

    bool flag = false;
    if (YAML::convert<bool>::decode(node, flag))
        return flag;

    throw config_error(fmt::format("Option '{}' has unsupported value '{}'", name, node.Scalar()));
}

} // namespace

std::optional<option_value> parse_option_value(std::string_view text)
{
    const auto lowered = lowercase(text);

    if (lowered.empty() || lowered == "null" || lowered == "none" || lowered == "~")
        return option_value{std::monostate{}};
    if (lowered == "true" || lowered == "yes" || lowered == "on")
        return option_value{true};
    if (lowered == "false" || lowered == "no" || lowered == "off")
        return option_value{false};

    std::int64_t integer = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), integer);
    if (ec == std::errc{} && ptr == text.data() + text.size())
        return option_value{integer};

    const std::string buffer(text);
    char* end = nullptr;
    const double number = std::strtod(buffer.c_str(), &end);
    if (end != buffer.c_str() && *end == '\0')
        return option_value{number};

    return std::nullopt;
}

option_map load_options(const YAML::Node& node)
{
    option_map options;

    if (!node || node.IsNull())
        return options;

    if (!node.IsMap())
        throw config_error("Chunk options must be a YAML mapping");

    for (const auto& entry : node)
    {
        const auto key = entry.first.as<std::string>();

        std::string name;
        try
        {
            name = std::string(canonical_option_name(key));
        }
        catch (const usage_error& e)
        {
            throw config_error(e.what());
        }

        options[name] = yaml_to_option(name, entry.second);
    }

    return options;
}

controller_settings load_settings(const YAML::Node& root)
{
    controller_settings settings;

    const auto section = root["chunkwise"];
    if (!section || !section.IsMap())
        throw config_error("Missing 'chunkwise' section");

    try
    {
        if (section["initial"])
            settings.initial_estimate = section["initial"].as<std::int64_t>();
        if (section["target"])
            settings.target_seconds = section["target"].as<double>();
    }
    catch (const YAML::Exception& e)
    {
        throw config_error(fmt::format("Malformed chunkwise settings: {}", e.what()));
    }

    if (settings.initial_estimate <= 0)
        throw config_error("'chunkwise.initial' must be a positive chunk size");
    if (!(settings.target_seconds > 0.0))
        throw config_error("'chunkwise.target' must be a positive number of seconds");

    settings.options = load_options(section["options"]);

    // Surface bad values now rather than at controller construction
    try
    {
        auto resolved = chunk_options::defaults_for(settings.initial_estimate);
        resolved.merge(settings.options);
        if (!resolved.is_valid())
            throw config_error("Chunk options are inconsistent (check min/max)");
    }
    catch (const usage_error& e)
    {
        throw config_error(e.what());
    }

    return settings;
}

controller_settings load_settings_file(const std::string& path)
{
    YAML::Node root;
    try
    {
        root = YAML::LoadFile(path);
    }
    catch (const YAML::Exception& e)
    {
        throw config_error(fmt::format("Failed to load {}: {}", path, e.what()));
    }

    return load_settings(root);
}

void apply_environment(option_map& options, std::string_view prefix)
{
    for (const auto& name : option_names())
    {
        const auto variable = std::string(prefix) + uppercase(name);
        const char* raw = std::getenv(variable.c_str());
        if (!raw)
            continue;

        auto value = parse_option_value(raw);
        if (!value)
            throw config_error(fmt::format("Cannot parse {}='{}'", variable, raw));

        if (std::holds_alternative<std::monostate>(*value) && name != "pause_always")
            throw config_error(fmt::format("{} cannot be empty or null", variable));

        options[std::string(name)] = *value;
    }
}

} // namespace chunkwise::config
