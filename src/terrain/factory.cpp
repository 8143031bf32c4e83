/**
 * @file factory.cpp
 * @brief Implementation for the terrain module.
 *
 * Maps configured scheme names onto gradient scheme instances.
 */

#include "factory.hpp"
#include "schemes/horn/horn.hpp"
#include "schemes/central/central.hpp"
#include "logging.hpp"
#include "string_utils.hpp"

namespace tpc {

/**
 * @brief Normalizes terrain scheme names and aliases.
 */
std::string normalize_terrain_scheme_name(std::string scheme_name)
{
    scheme_name = strutil::lower_copy(strutil::trim_copy(scheme_name));
    if (scheme_name.empty() || scheme_name == "sobel" || scheme_name == "3x3")
    {
        return "horn";
    }
    if (scheme_name == "central_difference" || scheme_name == "central-difference" ||
        scheme_name == "4cell")
    {
        return "central";
    }
    return scheme_name;
}

/**
 * @brief Creates a terrain scheme instance from configured id.
 */
std::unique_ptr<TerrainSchemeBase> create_terrain_scheme(const std::string& scheme_name)
{
    const std::string normalized_name = normalize_terrain_scheme_name(scheme_name);

    if (normalized_name == "horn")
    {
        return std::make_unique<HornScheme>();
    }
    else if (normalized_name == "central")
    {
        return std::make_unique<CentralDifferenceScheme>();
    }
    else
    {
        log_warning("Unknown terrain scheme '" + scheme_name + "'. Falling back to 'horn'.");
        return std::make_unique<HornScheme>();
    }
}

/**
 * @brief Gets the available terrain schemes.
 */
std::vector<std::string> get_available_terrain_schemes()
{
    return {"horn", "central"};
}

}
