/**
 * @file gradient.cpp
 * @brief Implementation for the terrain module.
 *
 * Provides the finite-difference building blocks used by the
 * gradient schemes and the terrain parameter extractor.
 */

#include "gradient.hpp"
#include "errors.hpp"
#include "physical_constants.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>


namespace tpc {
namespace gradient {

namespace
{
bool positive_finite(double value)
{
    return std::isfinite(value) && value > 0.0;
}
}

/**
 * @brief Returns the clamped neighbour pair for a central difference.
 */
NeighbourSpan neighbours(int index, int n)
{
    NeighbourSpan s{};
    s.lo = std::max(index - 1, 0);
    s.hi = std::min(index + 1, n - 1);
    s.span = s.hi - s.lo;
    return s;
}

double slope_from_gradient(double dzdx, double dzdy)
{
    return std::atan(std::sqrt(dzdx * dzdx + dzdy * dzdy));
}

/**
 * @brief Computes the bearing of -grad(z), clockwise from north.
 */
double aspect_from_gradient(double dzdx, double dzdy)
{
    if (std::hypot(dzdx, dzdy) < physical_constants::flat_gradient_epsilon)
    {
        return physical_constants::flat_aspect_rad;
    }
    // atan2(east, north) of the descent vector gives a compass bearing.
    return normalize_bearing(std::atan2(-dzdx, -dzdy));
}

double normalize_bearing(double angle_rad)
{
    double a = std::fmod(angle_rad, physical_constants::two_pi);
    if (a < 0.0)
    {
        a += physical_constants::two_pi;
    }
    // fmod of a tiny negative value can round back up to 2*pi.
    if (a >= physical_constants::two_pi)
    {
        a = 0.0;
    }
    return a;
}

/**
 * @brief Validates the elevation grid and terrain spacing.
 */
void validate_elevation_grid(const Grid2D& elevation, const TerrainConfig& cfg)
{
    if (!positive_finite(cfg.dx) || !positive_finite(cfg.dy))
    {
        std::ostringstream oss;
        oss << "cell spacing must be positive and finite (dx=" << cfg.dx
            << ", dy=" << cfg.dy << ")";
        throw InvalidGridError(oss.str());
    }
    if (!positive_finite(cfg.z_scale))
    {
        std::ostringstream oss;
        oss << "elevation z_scale must be positive and finite (z_scale=" << cfg.z_scale << ")";
        throw InvalidGridError(oss.str());
    }
    if (elevation.rows() < 2 || elevation.cols() < 2)
    {
        std::ostringstream oss;
        oss << "elevation grid must be at least 2x2 (got " << elevation.rows()
            << "x" << elevation.cols() << ")";
        throw InvalidGridError(oss.str());
    }
}

}
}
