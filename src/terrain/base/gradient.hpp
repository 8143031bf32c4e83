/**
 * @file gradient.hpp
 * @brief Declarations for the terrain module.
 *
 * Finite-difference helpers shared by the terrain gradient schemes:
 * border-aware neighbour selection, slope/aspect conversion and
 * elevation grid validation.
 */

#pragma once
#include "terrain_base.hpp"


namespace tpc {
namespace gradient {

/**
 * @brief Neighbour pair along one axis with the index distance between them.
 *
 * At the grid border the outer neighbour is clamped to the cell itself,
 * giving a one-sided difference with span 1 instead of 2.
 */
struct NeighbourSpan {
    int lo;
    int hi;
    int span;
};

/**
 * @brief Returns the clamped neighbour pair around `index` on an axis of length `n`.
 */
NeighbourSpan neighbours(int index, int n);

/**
 * @brief Converts gradient components to slope in radians.
 */
double slope_from_gradient(double dzdx, double dzdy);

/**
 * @brief Converts gradient components to the downslope compass bearing.
 *
 * Returns physical_constants::flat_aspect_rad when the gradient vanishes.
 */
double aspect_from_gradient(double dzdx, double dzdy);

/**
 * @brief Normalizes an angle into [0, 2*pi).
 */
double normalize_bearing(double angle_rad);

/**
 * @brief Validates grid size and spacing.
 * @throws InvalidGridError when spacing is not positive and finite or the
 *         grid has fewer than 2 rows or columns.
 */
void validate_elevation_grid(const Grid2D& elevation, const TerrainConfig& cfg);

}
}
