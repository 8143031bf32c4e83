/**
 * @file terrain.cpp
 * @brief Core pipeline implementation for terrain parameter extraction.
 *
 * Validates the elevation grid, instantiates the configured gradient
 * scheme and converts per-cell gradients into slope and aspect rasters.
 */

#include "terrain_base.hpp"
#include "terrain/factory.hpp"
#include "terrain/base/gradient.hpp"
#include "logging.hpp"
#include "physical_constants.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>


namespace tpc
{

namespace
{
void fill_diagnostics(const TerrainParameters& params, TerrainDiagnostics& diag)
{
    diag = TerrainDiagnostics{};
    double sum = 0.0;
    std::size_t finite_count = 0;
    for (double s : params.slope)
    {
        if (!std::isfinite(s))
        {
            continue;
        }
        diag.max_slope = std::max(diag.max_slope, s);
        sum += s;
        ++finite_count;
        if (s == 0.0)
        {
            ++diag.flat_cells;
        }
    }
    diag.mean_slope = finite_count > 0 ? sum / static_cast<double>(finite_count) : 0.0;
}
}

/**
 * @brief Derives slope and aspect from elevation.
 */
TerrainParameters extract_terrain_parameters(const Grid2D& elevation,
                                             const TerrainConfig& cfg,
                                             TerrainDiagnostics* diag_opt)
{
    gradient::validate_elevation_grid(elevation, cfg);

    std::unique_ptr<TerrainSchemeBase> scheme = create_terrain_scheme(cfg.scheme_id);
    scheme->initialize(cfg);

    const int rows = elevation.rows();
    const int cols = elevation.cols();

    TerrainParameters params;
    params.slope.resize(rows, cols);
    params.aspect.resize(rows, cols);

    const TerrainSchemeBase& s = *scheme;
    #pragma omp parallel for collapse(2)
    for (int r = 0; r < rows; ++r)
    {
        for (int c = 0; c < cols; ++c)
        {
            double dzdx = 0.0;
            double dzdy = 0.0;
            s.gradient_at(elevation, r, c, dzdx, dzdy);

            const double slope = gradient::slope_from_gradient(dzdx, dzdy);
            // Exactly zero on flat cells so downstream checks can rely on it.
            const bool flat = std::hypot(dzdx, dzdy) < physical_constants::flat_gradient_epsilon;
            params.slope(r, c) = flat ? 0.0 : slope;
            params.aspect(r, c) = gradient::aspect_from_gradient(dzdx, dzdy);
        }
    }

    if (diag_opt || log_normal_enabled())
    {
        TerrainDiagnostics diag;
        fill_diagnostics(params, diag);
        if (log_normal_enabled())
        {
            std::cout << "Terrain parameters built:"
                      << " scheme=" << scheme->name()
                      << ", size=" << rows << "x" << cols
                      << ", max_slope=" << diag.max_slope * physical_constants::rad_to_deg << " deg"
                      << ", flat_cells=" << diag.flat_cells
                      << std::endl;
        }
        if (diag_opt)
        {
            *diag_opt = diag;
        }
    }

    return params;
}

} // namespace tpc
