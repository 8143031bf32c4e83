#pragma once

/**
 * @file physical_constants.hpp
 * @brief Shared angular and numeric constants.
 *
 * Centralizes the angle conversions and tolerances used by the terrain,
 * solar geometry, illumination and correction components so that
 * every stage agrees on the same values.
 */

namespace tpc
{
namespace physical_constants
{
inline constexpr double pi = 3.14159265358979323846;
inline constexpr double two_pi = 2.0 * pi;
inline constexpr double half_pi = 0.5 * pi;
inline constexpr double deg_to_rad = pi / 180.0;
inline constexpr double rad_to_deg = 180.0 / pi;

// Gradient magnitude below which a DEM cell counts as flat.
inline constexpr double flat_gradient_epsilon = 1e-12;

// Aspect assigned to flat cells (north).
inline constexpr double flat_aspect_rad = 0.0;

// Tolerance used to decide that an illumination map is uniform.
inline constexpr double uniform_illumination_tolerance = 1e-12;

inline constexpr double default_illumination_floor = 0.05;
} // namespace physical_constants
} // namespace tpc
