#pragma once

#include <string>
#include <unordered_map>

#include "correction_base.hpp"
#include "solar_geometry.hpp"
#include "terrain_base.hpp"

/**
 * @file runtime_config.hpp
 * @brief Configuration parsing helpers.
 *
 * Reads the YAML-like configuration file into the correction, terrain and
 * solar input configurations. Invalid values warn and keep the previous value.
 */

namespace tpc
{

/**
 * @brief Parses an integer value.
 * @param value Input string.
 * @param out Parsed integer output.
 * @return True on successful parse.
 */
bool try_parse_int_value(const std::string& value, int& out);

/**
 * @brief Parses a non-negative integer value.
 * @param value Input string.
 * @param out Parsed integer output.
 * @return True on successful parse and non-negative result.
 */
bool try_parse_non_negative_int_value(const std::string& value, int& out);

/**
 * @brief Parses a strictly positive integer value.
 */
bool try_parse_positive_int_value(const std::string& value, int& out);

/**
 * @brief Parses a finite floating-point value.
 * @param value Input string.
 * @param out Parsed double output.
 * @return True on successful parse.
 */
bool try_parse_double_value(const std::string& value, double& out);

/**
 * @brief Parses a finite, strictly positive floating-point value.
 */
bool try_parse_positive_double_value(const std::string& value, double& out);

/**
 * @brief Parses a simple key-value YAML file.
 *
 * Nested sections are flattened into dotted keys (`correction.method`).
 * `#` starts a comment; wrapping quotes around values are removed.
 *
 * @param filename Input file path.
 * @return Parsed key-value map, empty when the file cannot be opened.
 */
std::unordered_map<std::string, std::string> parse_yaml_simple(const std::string& filename);

/**
 * @brief Applies an already parsed key-value map to the configurations.
 * @return Number of recognised keys.
 */
int apply_config_values(const std::unordered_map<std::string, std::string>& config,
                        CorrectionConfig& correction,
                        TerrainConfig& terrain,
                        SolarInputConfig& solar);

/**
 * @brief Loads configuration from disk.
 * @param config_path Path to configuration file.
 * @param correction Correction settings, updated in place.
 * @param terrain Terrain extraction settings, updated in place.
 * @param solar Solar input settings, updated in place.
 */
void load_config(const std::string& config_path,
                 CorrectionConfig& correction,
                 TerrainConfig& terrain,
                 SolarInputConfig& solar);

} // namespace tpc
