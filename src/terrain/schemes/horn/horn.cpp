#include "horn.hpp"
#include "logging.hpp"
#include <iostream>

/*This file contains the implementation of the Horn gradient scheme.
Each derivative is a 1-2-1 weighted average of three central differences taken
across the 3x3 window. Rows and columns outside the grid are clamped, and each
difference is divided by its actual index span.*/

namespace tpc {

HornScheme::HornScheme()
{
}

void HornScheme::initialize(const TerrainConfig& cfg)
{
    config_ = cfg;

    if (log_debug_enabled())
    {
        std::cout << "Initialized Horn terrain scheme" << std::endl;
        std::cout << "  dx = " << cfg.dx << ", dy = " << cfg.dy << std::endl;
        std::cout << "  z_scale = " << cfg.z_scale << std::endl;
    }
}

/*This function computes the gradient at one cell.
Row index grows southwards, so the northward derivative takes the upper
neighbour minus the lower one.*/
void HornScheme::gradient_at(const Grid2D& elevation, int r, int c,
                             double& dzdx, double& dzdy) const
{
    const gradient::NeighbourSpan ew = gradient::neighbours(c, elevation.cols());
    const gradient::NeighbourSpan ns = gradient::neighbours(r, elevation.rows());
    static const int offsets[3] = {-1, 0, 1};
    static const double weights[3] = {1.0, 2.0, 1.0};

    double sum_x = 0.0;
    double sum_y = 0.0;
    for (int k = 0; k < 3; ++k)
    {
        const int rr = r + offsets[k];
        const int cc = c + offsets[k];
        sum_x += weights[k] * (elevation.clamped(rr, ew.hi) - elevation.clamped(rr, ew.lo));
        sum_y += weights[k] * (elevation.clamped(ns.lo, cc) - elevation.clamped(ns.hi, cc));
    }

    dzdx = config_.z_scale * sum_x / (4.0 * config_.dx * ew.span);
    dzdy = config_.z_scale * sum_y / (4.0 * config_.dy * ns.span);
}

}
