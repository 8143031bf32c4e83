#include "central.hpp"
#include "logging.hpp"
#include <iostream>

namespace tpc {

CentralDifferenceScheme::CentralDifferenceScheme()
{
}

void CentralDifferenceScheme::initialize(const TerrainConfig& cfg)
{
    config_ = cfg;

    if (log_debug_enabled())
    {
        std::cout << "Initialized central-difference terrain scheme" << std::endl;
        std::cout << "  dx = " << cfg.dx << ", dy = " << cfg.dy
                  << ", z_scale = " << cfg.z_scale << std::endl;
    }
}

void CentralDifferenceScheme::gradient_at(const Grid2D& elevation, int r, int c,
                                          double& dzdx, double& dzdy) const
{
    const gradient::NeighbourSpan ew = gradient::neighbours(c, elevation.cols());
    const gradient::NeighbourSpan ns = gradient::neighbours(r, elevation.rows());

    dzdx = config_.z_scale * (elevation(r, ew.hi) - elevation(r, ew.lo)) / (config_.dx * ew.span);
    // North is the lower row index.
    dzdy = config_.z_scale * (elevation(ns.lo, c) - elevation(ns.hi, c)) / (config_.dy * ns.span);
}

}
