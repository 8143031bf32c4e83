/**
 * @file factory.hpp
 * @brief Declarations for the terrain module.
 *
 * Scheme lookup for slope/aspect extraction.
 */

#pragma once
#include <memory>
#include <string>
#include "terrain_base.hpp"

namespace tpc {

/**
 * @brief Normalizes terrain scheme names and aliases.
 */
std::string normalize_terrain_scheme_name(std::string scheme_name);

}
