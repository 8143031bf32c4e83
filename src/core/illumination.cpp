/**
 * @file illumination.cpp
 * @brief Illumination model: elementwise cos(incidence) over the scene.
 */

#include "illumination.hpp"
#include "errors.hpp"
#include "physical_constants.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace tpc
{

double cos_incidence(double slope, double aspect, const SolarAngles& sun)
{
    return std::cos(slope) * std::cos(sun.zenith) +
           std::sin(slope) * std::sin(sun.zenith) * std::cos(sun.azimuth - aspect);
}

/**
 * @brief Computes the illumination map.
 */
Grid2D compute_illumination(const TerrainParameters& terrain, const SolarAngles& sun)
{
    if (!terrain.slope.same_shape(terrain.aspect))
    {
        throw InvalidGridError("slope and aspect grids differ in shape");
    }

    const int rows = terrain.slope.rows();
    const int cols = terrain.slope.cols();
    Grid2D illumination(rows, cols);

    // Scene constants hoisted out of the pixel loop.
    const double cos_sz = std::cos(sun.zenith);
    const double sin_sz = std::sin(sun.zenith);

    #pragma omp parallel for collapse(2)
    for (int r = 0; r < rows; ++r)
    {
        for (int c = 0; c < cols; ++c)
        {
            const double beta = terrain.slope(r, c);
            illumination(r, c) = std::cos(beta) * cos_sz +
                                 std::sin(beta) * sin_sz * std::cos(sun.azimuth - terrain.aspect(r, c));
        }
    }

    return illumination;
}

IlluminationStats illumination_stats(const Grid2D& illumination)
{
    IlluminationStats stats;
    stats.min_value = std::numeric_limits<double>::infinity();
    stats.max_value = -std::numeric_limits<double>::infinity();

    double sum = 0.0;
    std::size_t finite_count = 0;
    for (double v : illumination)
    {
        if (!std::isfinite(v))
        {
            ++stats.nonfinite_count;
            continue;
        }
        stats.min_value = std::min(stats.min_value, v);
        stats.max_value = std::max(stats.max_value, v);
        sum += v;
        ++finite_count;
        if (v <= 0.0)
        {
            ++stats.shadowed_count;
        }
    }

    if (finite_count == 0)
    {
        stats.min_value = 0.0;
        stats.max_value = 0.0;
        return stats;
    }
    stats.mean_value = sum / static_cast<double>(finite_count);
    return stats;
}

bool is_flat_illumination(const Grid2D& illumination, const SolarAngles& sun)
{
    const IlluminationStats stats = illumination_stats(illumination);
    if (stats.nonfinite_count == illumination.size())
    {
        return false;
    }
    const double cos_sz = sun.cos_zenith();
    const double tol = physical_constants::uniform_illumination_tolerance;
    return std::abs(stats.max_value - cos_sz) <= tol && std::abs(stats.min_value - cos_sz) <= tol;
}

} // namespace tpc
