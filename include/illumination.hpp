#pragma once

#include <cstddef>

#include "grid2d.hpp"
#include "solar_geometry.hpp"
#include "terrain_base.hpp"

/**
 * @file illumination.hpp
 * @brief Per-pixel local illumination (cosine of the solar incidence angle).
 *
 * cos(gamma_i) = cos(beta) cos(theta_s) + sin(beta) sin(theta_s) cos(phi_s - phi_n)
 *
 * The map is left unclamped; values at or below zero mark self-shadowed
 * terrain. Correction schemes apply their own floor where the value ends up
 * in a denominator.
 */

namespace tpc
{

struct IlluminationStats
{
    double min_value = 0.0;
    double max_value = 0.0;
    double mean_value = 0.0;
    std::size_t shadowed_count = 0;
    std::size_t nonfinite_count = 0;
};

/**
 * @brief Evaluates cos(incidence) for one facet.
 * @param slope Terrain slope in radians.
 * @param aspect Downslope bearing in radians.
 * @param sun Solar angles.
 */
double cos_incidence(double slope, double aspect, const SolarAngles& sun);

/**
 * @brief Computes the illumination map from terrain parameters.
 * @throws InvalidGridError when slope and aspect differ in shape.
 */
Grid2D compute_illumination(const TerrainParameters& terrain, const SolarAngles& sun);

/**
 * @brief Summarizes an illumination map over its finite values.
 */
IlluminationStats illumination_stats(const Grid2D& illumination);

/**
 * @brief Reports whether every finite value equals cos(zenith) within tolerance.
 */
bool is_flat_illumination(const Grid2D& illumination, const SolarAngles& sun);

} // namespace tpc
