/**
 * @file runtime_config.cpp
 * @brief Configuration loading for the correction library.
 *
 * Provides the process-wide logging profile, the YAML-like file parser and
 * the mapping from dotted keys onto the correction, terrain and solar
 * configurations.
 */

#include "runtime_config.hpp"

#include <cmath>
#include <exception>
#include <fstream>
#include <initializer_list>
#include <iostream>
#include <limits>
#include <vector>

#include "logging.hpp"
#include "string_utils.hpp"

namespace tpc {

LogProfile global_log_profile = LogProfile::normal;

namespace {

/**
 * @brief Removes matching single or double quotes around a string value.
 */
std::string strip_wrapping_quotes(std::string value)
{
    if (value.size() >= 2)
    {
        const char first = value.front();
        const char last = value.back();
        if ((first == '"' && last == '"') || (first == '\'' && last == '\''))
        {
            return value.substr(1, value.size() - 2);
        }
    }
    return value;
}

/**
 * @brief Emits a standardized warning for invalid configuration values.
 */
void warn_invalid_config_value(const std::string& key,
                               const std::string& value,
                               const char* expected)
{
    if (global_log_profile == LogProfile::quiet)
    {
        return;
    }
    std::cerr << "Warning: Invalid " << key << " '" << value
              << "'; expected " << expected
              << ". Keeping previous/default value." << std::endl;
}

/**
 * @brief Looks up the first present key among aliases.
 */
const std::string* find_value(const std::unordered_map<std::string, std::string>& config,
                              std::initializer_list<const char*> keys,
                              std::string& key_out)
{
    for (const char* key : keys)
    {
        const auto it = config.find(key);
        if (it != config.end())
        {
            key_out = key;
            return &it->second;
        }
    }
    return nullptr;
}

void apply_positive_double(const std::unordered_map<std::string, std::string>& config,
                           const char* key,
                           double& target,
                           int& recognised)
{
    const auto it = config.find(key);
    if (it == config.end())
    {
        return;
    }
    ++recognised;
    double parsed = 0.0;
    if (try_parse_positive_double_value(it->second, parsed))
    {
        target = parsed;
    }
    else
    {
        warn_invalid_config_value(key, it->second, "a positive number");
    }
}

}

/**
 * @brief Emits a warning line unless logging is quiet.
 */
void log_warning(const std::string& message)
{
    if (global_log_profile == LogProfile::quiet)
    {
        return;
    }
    std::cerr << "Warning: " << message << std::endl;
}

/**
 * @brief Returns string label for runtime logging profile.
 */
const char* log_profile_name(LogProfile profile)
{
    switch (profile)
    {
        case LogProfile::quiet:
            return "quiet";
        case LogProfile::debug:
            return "debug";
        case LogProfile::normal:
        default:
            return "normal";
    }
}

/**
 * @brief Parses runtime logging profile from text.
 */
LogProfile parse_log_profile(const std::string& value, bool* valid)
{
    const std::string normalized = strutil::lower_copy(strutil::trim_copy(value));
    if (normalized == "quiet")
    {
        if (valid) *valid = true;
        return LogProfile::quiet;
    }
    if (normalized == "normal")
    {
        if (valid) *valid = true;
        return LogProfile::normal;
    }
    if (normalized == "debug")
    {
        if (valid) *valid = true;
        return LogProfile::debug;
    }

    if (valid) *valid = false;
    return LogProfile::normal;
}

/**
 * @brief Parses an integer value.
 */
bool try_parse_int_value(const std::string& value, int& out)
{
    try
    {
        size_t consumed = 0;
        const long long parsed = std::stoll(value, &consumed);
        if (consumed != value.size() ||
            parsed < static_cast<long long>(std::numeric_limits<int>::min()) ||
            parsed > static_cast<long long>(std::numeric_limits<int>::max()))
        {
            return false;
        }
        out = static_cast<int>(parsed);
        return true;
    }
    catch (const std::exception&)
    {
        return false;
    }
}

/**
 * @brief Parses a non-negative integer value.
 */
bool try_parse_non_negative_int_value(const std::string& value, int& out)
{
    int parsed = 0;
    if (!try_parse_int_value(value, parsed) || parsed < 0)
    {
        return false;
    }
    out = parsed;
    return true;
}

/**
 * @brief Parses a strictly positive integer value.
 */
bool try_parse_positive_int_value(const std::string& value, int& out)
{
    int parsed = 0;
    if (!try_parse_int_value(value, parsed) || parsed <= 0)
    {
        return false;
    }
    out = parsed;
    return true;
}

/**
 * @brief Parses a finite floating-point value.
 */
bool try_parse_double_value(const std::string& value, double& out)
{
    try
    {
        size_t consumed = 0;
        const double parsed = std::stod(value, &consumed);
        if (consumed != value.size() || !std::isfinite(parsed))
        {
            return false;
        }
        out = parsed;
        return true;
    }
    catch (const std::exception&)
    {
        return false;
    }
}

bool try_parse_positive_double_value(const std::string& value, double& out)
{
    double parsed = 0.0;
    if (!try_parse_double_value(value, parsed) || parsed <= 0.0)
    {
        return false;
    }
    out = parsed;
    return true;
}

/**
 * @brief Parses simplified YAML key-value content with nested sections.
 */
std::unordered_map<std::string, std::string> parse_yaml_simple(const std::string& filename)
{
    std::unordered_map<std::string, std::string> config;
    std::ifstream file(filename);
    if (!file.is_open())
    {
        std::cerr << "Could not open config file: " << filename << std::endl;
        return config;
    }

    std::string line;
    std::vector<std::string> section_stack;

    while (std::getline(file, line))
    {
        const size_t comment_pos = line.find('#');
        if (comment_pos != std::string::npos)
        {
            line = line.substr(0, comment_pos);
        }

        size_t indent = 0;
        while (indent < line.size() && line[indent] == ' ') indent++;
        const size_t indent_level = indent / 2;

        line = strutil::trim_copy(line);
        if (line.empty()) continue;

        while (section_stack.size() > indent_level)
        {
            section_stack.pop_back();
        }

        if (line.back() == ':')
        {
            const std::string section_name = strutil::trim_copy(line.substr(0, line.size() - 1));
            section_stack.push_back(section_name);
            continue;
        }

        const size_t colon_pos = line.find(':');
        if (colon_pos == std::string::npos)
        {
            continue;
        }

        const std::string key = strutil::trim_copy(line.substr(0, colon_pos));
        const std::string value = strip_wrapping_quotes(strutil::trim_copy(line.substr(colon_pos + 1)));

        std::string full_key;
        for (const auto& section : section_stack)
        {
            if (!full_key.empty()) full_key += ".";
            full_key += section;
        }
        if (!full_key.empty()) full_key += ".";
        full_key += key;
        config[full_key] = value;
    }

    return config;
}

/*This function maps dotted keys onto the configuration structs.
Every invalid value warns and leaves the target untouched so a partially bad
file still yields a usable configuration.*/
int apply_config_values(const std::unordered_map<std::string, std::string>& config,
                        CorrectionConfig& correction,
                        TerrainConfig& terrain,
                        SolarInputConfig& solar)
{
    int recognised = 0;
    std::string key;

    if (const std::string* value = find_value(config, {"logging.profile"}, key))
    {
        ++recognised;
        bool valid = false;
        const LogProfile parsed = parse_log_profile(*value, &valid);
        if (valid)
        {
            global_log_profile = parsed;
        }
        else
        {
            warn_invalid_config_value(key, *value, "quiet, normal or debug");
        }
    }

    if (const std::string* value = find_value(config, {"correction.method"}, key))
    {
        ++recognised;
        const std::string normalized = normalize_correction_method_name(*value);
        if (!normalized.empty())
        {
            correction.method_id = normalized;
        }
        else
        {
            warn_invalid_config_value(key, *value, "c, minnaert or stat");
        }
    }

    if (const std::string* value = find_value(config, {"correction.n_strat", "correction.nStrat"}, key))
    {
        ++recognised;
        int parsed = 0;
        if (try_parse_non_negative_int_value(*value, parsed))
        {
            correction.n_strat = parsed;
        }
        else
        {
            warn_invalid_config_value(key, *value, "a non-negative integer");
        }
    }

    if (const std::string* value = find_value(config, {"correction.illumination_floor"}, key))
    {
        ++recognised;
        double parsed = 0.0;
        if (try_parse_positive_double_value(*value, parsed))
        {
            correction.illumination_floor = parsed;
        }
        else
        {
            warn_invalid_config_value(key, *value, "a positive number");
        }
    }

    if (const std::string* value = find_value(config, {"correction.nodata"}, key))
    {
        ++recognised;
        const std::string normalized = strutil::lower_copy(*value);
        double parsed = 0.0;
        if (normalized == "none" || normalized == "off" || normalized.empty())
        {
            correction.has_nodata = false;
        }
        else if (try_parse_double_value(*value, parsed))
        {
            correction.has_nodata = true;
            correction.nodata_value = parsed;
        }
        else
        {
            warn_invalid_config_value(key, *value, "a number or none");
        }
    }

    if (const std::string* value = find_value(config, {"correction.sample_stride"}, key))
    {
        ++recognised;
        int parsed = 0;
        if (try_parse_positive_int_value(*value, parsed))
        {
            correction.sample_stride = parsed;
        }
        else
        {
            warn_invalid_config_value(key, *value, "a positive integer");
        }
    }

    if (const std::string* value = find_value(config, {"correction.degenerate_policy"}, key))
    {
        ++recognised;
        DegeneratePolicy policy = correction.degenerate_policy;
        if (parse_degenerate_policy(*value, policy))
        {
            correction.degenerate_policy = policy;
        }
        else
        {
            warn_invalid_config_value(key, *value, "identity or strict");
        }
    }

    if (const std::string* value = find_value(config, {"terrain.scheme"}, key))
    {
        ++recognised;
        // Unknown names are resolved (with a warning) by the terrain factory.
        terrain.scheme_id = strutil::lower_copy(strutil::trim_copy(*value));
    }

    apply_positive_double(config, "terrain.dx", terrain.dx, recognised);
    apply_positive_double(config, "terrain.dy", terrain.dy, recognised);
    apply_positive_double(config, "terrain.z_scale", terrain.z_scale, recognised);

    if (const std::string* value = find_value(config, {"solar.angle_unit"}, key))
    {
        ++recognised;
        AngleUnit unit = solar.angle_unit;
        if (parse_angle_unit(*value, unit))
        {
            solar.angle_unit = unit;
        }
        else
        {
            warn_invalid_config_value(key, *value, "degrees or radians");
        }
    }

    return recognised;
}

/**
 * @brief Loads the configuration from a YAML file.
 */
void load_config(const std::string& config_path,
                 CorrectionConfig& correction,
                 TerrainConfig& terrain,
                 SolarInputConfig& solar)
{
    if (config_path.empty())
    {
        return;
    }

    const auto config = parse_yaml_simple(config_path);
    const int recognised = apply_config_values(config, correction, terrain, solar);

    if (log_normal_enabled())
    {
        std::cout << "Loaded config with " << config.size() << " keys ("
                  << recognised << " recognised)" << std::endl;
        std::cout << "  correction.method=" << correction.method_id
                  << " n_strat=" << correction.n_strat
                  << " illumination_floor=" << correction.illumination_floor
                  << " degenerate_policy=" << to_string(correction.degenerate_policy) << std::endl;
        std::cout << "  terrain.scheme=" << terrain.scheme_id
                  << " dx=" << terrain.dx << " dy=" << terrain.dy
                  << " z_scale=" << terrain.z_scale << std::endl;
        std::cout << "  solar.angle_unit=" << to_string(solar.angle_unit)
                  << " log_profile=" << log_profile_name(global_log_profile) << std::endl;
    }
}

}
