#pragma once

#include <memory>
#include <string>
#include <vector>

#include "grid2d.hpp"

/**
 * @file terrain_base.hpp
 * @brief Terrain parameter extraction interfaces.
 *
 * Declares the configuration, output containers and scheme contract used to
 * derive slope and aspect rasters from a digital elevation grid.
 * Provides the factory and the pipeline entry point.
 */

namespace tpc
{

struct TerrainConfig
{
    std::string scheme_id = "horn";
    double dx = 1.0;       // west-east cell spacing
    double dy = 1.0;       // north-south cell spacing
    double z_scale = 1.0;  // elevation unit multiplier (e.g. 0.1 for decimetre DEMs)
};

/**
 * @brief Slope and aspect rasters co-registered with the elevation grid.
 *
 * slope is in radians (0 = flat). aspect is the compass bearing of steepest
 * descent in radians, clockwise from north, in [0, 2*pi). Flat cells carry
 * aspect 0.
 */
struct TerrainParameters
{
    Grid2D slope;
    Grid2D aspect;
};

struct TerrainDiagnostics
{
    double max_slope = 0.0;
    double mean_slope = 0.0;
    std::size_t flat_cells = 0;
};

class TerrainSchemeBase
{
public:
    virtual ~TerrainSchemeBase() = default;

    /**
     * @brief Returns the scheme identifier.
     */
    virtual std::string name() const = 0;

    /**
     * @brief Initializes scheme internals from configuration.
     */
    virtual void initialize(const TerrainConfig& cfg) = 0;

    /**
     * @brief Computes the surface gradient at one cell.
     * @param elevation Elevation grid.
     * @param r Row index.
     * @param c Column index.
     * @param dzdx Output eastward derivative.
     * @param dzdy Output northward derivative.
     */
    virtual void gradient_at(const Grid2D& elevation, int r, int c,
                             double& dzdx, double& dzdy) const = 0;
};

/**
 * @brief Creates a terrain gradient scheme by name.
 * @param scheme_name Scheme identifier or alias.
 * @return Owning pointer to a scheme instance.
 */
std::unique_ptr<TerrainSchemeBase> create_terrain_scheme(const std::string& scheme_name);

/**
 * @brief Lists registered terrain schemes.
 */
std::vector<std::string> get_available_terrain_schemes();

/**
 * @brief Derives slope and aspect rasters from an elevation grid.
 * @param elevation Elevation grid (at least 2x2).
 * @param cfg Terrain configuration with cell spacing.
 * @param diag_opt Optional diagnostics output.
 * @return Terrain parameters with the grid's dimensions.
 * @throws InvalidGridError on bad spacing or an undersized grid.
 */
TerrainParameters extract_terrain_parameters(const Grid2D& elevation,
                                             const TerrainConfig& cfg,
                                             TerrainDiagnostics* diag_opt = nullptr);

} // namespace tpc
