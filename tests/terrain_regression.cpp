#include "terrain_base.hpp"
#include "terrain/base/gradient.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "physical_constants.hpp"

#include <cmath>
#include <iostream>
#include <string>

namespace
{
using namespace tpc;

bool nearly_equal(double a, double b, double tol = 1.0e-12)
{
    return std::abs(a - b) <= tol;
}

int expect_true(bool cond, const std::string& message)
{
    if (!cond)
    {
        std::cerr << "[terrain-regression] FAIL: " << message << std::endl;
        return 1;
    }
    return 0;
}

int expect_close(double actual, double expected, const std::string& label, double tol = 1.0e-12)
{
    if (!nearly_equal(actual, expected, tol))
    {
        std::cerr << "[terrain-regression] FAIL: " << label
                  << " actual=" << actual
                  << " expected=" << expected
                  << " tol=" << tol << std::endl;
        return 1;
    }
    return 0;
}

Grid2D east_rising_ramp(int rows, int cols, double rise_per_cell)
{
    Grid2D z(rows, cols);
    for (int r = 0; r < rows; ++r)
    {
        for (int c = 0; c < cols; ++c)
        {
            z(r, c) = rise_per_cell * c;
        }
    }
    return z;
}

int test_linear_ramp_horn()
{
    int failures = 0;
    // 10 units of rise per 25-unit cell toward the east.
    const Grid2D z = east_rising_ramp(3, 3, 10.0);

    TerrainConfig cfg;
    cfg.dx = 25.0;
    cfg.dy = 25.0;

    const TerrainParameters params = extract_terrain_parameters(z, cfg);
    failures += expect_true(params.slope.rows() == 3 && params.slope.cols() == 3, "slope must match DEM shape");
    failures += expect_true(params.aspect.same_shape(z), "aspect must match DEM shape");

    const double expected_slope = std::atan(10.0 / 25.0);
    // Steepest descent points west.
    const double expected_aspect = 1.5 * physical_constants::pi;
    for (int r = 0; r < 3; ++r)
    {
        for (int c = 0; c < 3; ++c)
        {
            const std::string at = "(" + std::to_string(r) + "," + std::to_string(c) + ")";
            failures += expect_close(params.slope(r, c), expected_slope, "ramp slope " + at);
            failures += expect_close(params.aspect(r, c), expected_aspect, "ramp aspect " + at);
        }
    }
    return failures;
}

int test_linear_ramp_central_matches_horn()
{
    int failures = 0;
    const Grid2D z = east_rising_ramp(4, 5, 10.0);

    TerrainConfig horn_cfg;
    horn_cfg.dx = 25.0;
    horn_cfg.dy = 25.0;
    TerrainConfig central_cfg = horn_cfg;
    central_cfg.scheme_id = "central_difference";

    const TerrainParameters horn = extract_terrain_parameters(z, horn_cfg);
    const TerrainParameters central = extract_terrain_parameters(z, central_cfg);
    for (int r = 0; r < z.rows(); ++r)
    {
        for (int c = 0; c < z.cols(); ++c)
        {
            failures += expect_close(central.slope(r, c), horn.slope(r, c), "central slope equals horn on a plane");
            failures += expect_close(central.aspect(r, c), horn.aspect(r, c), "central aspect equals horn on a plane");
        }
    }
    return failures;
}

int test_cardinal_aspects()
{
    int failures = 0;
    TerrainConfig cfg;

    // Row 0 is north. Elevation highest in the north means descent to the south.
    Grid2D north_high(3, 3);
    // Elevation highest in the south means descent to the north.
    Grid2D south_high(3, 3);
    for (int r = 0; r < 3; ++r)
    {
        for (int c = 0; c < 3; ++c)
        {
            north_high(r, c) = 5.0 * (2 - r);
            south_high(r, c) = 5.0 * r;
        }
    }

    const TerrainParameters to_south = extract_terrain_parameters(north_high, cfg);
    const TerrainParameters to_north = extract_terrain_parameters(south_high, cfg);
    failures += expect_close(to_south.aspect(1, 1), physical_constants::pi, "north-high surface faces south");
    failures += expect_close(to_north.aspect(1, 1), 0.0, "south-high surface faces north");
    failures += expect_close(to_south.slope(1, 1), std::atan(5.0), "north-high slope");

    Grid2D west_high = east_rising_ramp(3, 3, -2.0);
    const TerrainParameters to_east = extract_terrain_parameters(west_high, cfg);
    failures += expect_close(to_east.aspect(1, 1), 0.5 * physical_constants::pi, "west-high surface faces east");
    return failures;
}

int test_flat_grid()
{
    int failures = 0;
    const Grid2D z(4, 4, 812.5);
    TerrainDiagnostics diag;
    const TerrainParameters params = extract_terrain_parameters(z, TerrainConfig{}, &diag);
    for (int r = 0; r < 4; ++r)
    {
        for (int c = 0; c < 4; ++c)
        {
            failures += expect_true(params.slope(r, c) == 0.0, "flat slope must be exactly zero");
            failures += expect_true(params.aspect(r, c) == physical_constants::flat_aspect_rad,
                                    "flat aspect must use the sentinel");
        }
    }
    failures += expect_true(diag.flat_cells == 16, "diagnostics must count every flat cell");
    failures += expect_close(diag.max_slope, 0.0, "flat max slope");
    return failures;
}

int test_border_uses_one_sided_difference()
{
    int failures = 0;
    // z = c^2 along each row.
    Grid2D z(3, 4);
    for (int r = 0; r < 3; ++r)
    {
        for (int c = 0; c < 4; ++c)
        {
            z(r, c) = static_cast<double>(c * c);
        }
    }

    TerrainConfig cfg;
    cfg.scheme_id = "central";
    const TerrainParameters params = extract_terrain_parameters(z, cfg);

    // Column 0: (1 - 0) / 1, column 1: (4 - 0) / 2, column 3: (9 - 4) / 1.
    failures += expect_close(params.slope(1, 0), std::atan(1.0), "west border one-sided slope");
    failures += expect_close(params.slope(1, 1), std::atan(2.0), "interior central slope");
    failures += expect_close(params.slope(1, 3), std::atan(5.0), "east border one-sided slope");

    const gradient::NeighbourSpan first = gradient::neighbours(0, 4);
    const gradient::NeighbourSpan last = gradient::neighbours(3, 4);
    const gradient::NeighbourSpan mid = gradient::neighbours(2, 4);
    failures += expect_true(first.lo == 0 && first.hi == 1 && first.span == 1, "first-cell neighbours clamp");
    failures += expect_true(last.lo == 2 && last.hi == 3 && last.span == 1, "last-cell neighbours clamp");
    failures += expect_true(mid.lo == 1 && mid.hi == 3 && mid.span == 2, "interior neighbours span two cells");
    return failures;
}

int test_z_scale_and_spacing()
{
    int failures = 0;
    const Grid2D z = east_rising_ramp(3, 3, 100.0);

    TerrainConfig cfg;
    cfg.dx = 50.0;
    cfg.dy = 10.0;
    cfg.z_scale = 0.1;
    const TerrainParameters params = extract_terrain_parameters(z, cfg);
    failures += expect_close(params.slope(1, 1), std::atan(10.0 / 50.0), "z_scale and dx must scale the gradient");
    return failures;
}

int test_invalid_inputs_throw()
{
    int failures = 0;
    const Grid2D z = east_rising_ramp(3, 3, 1.0);

    auto throws_invalid_grid = [](const Grid2D& grid, const TerrainConfig& cfg)
    {
        try
        {
            (void)extract_terrain_parameters(grid, cfg);
        }
        catch (const InvalidGridError&)
        {
            return true;
        }
        return false;
    };

    TerrainConfig zero_dx;
    zero_dx.dx = 0.0;
    failures += expect_true(throws_invalid_grid(z, zero_dx), "dx = 0 must be rejected");

    TerrainConfig negative_dy;
    negative_dy.dy = -5.0;
    failures += expect_true(throws_invalid_grid(z, negative_dy), "negative dy must be rejected");

    TerrainConfig nan_scale;
    nan_scale.z_scale = std::nan("");
    failures += expect_true(throws_invalid_grid(z, nan_scale), "non-finite z_scale must be rejected");

    failures += expect_true(throws_invalid_grid(Grid2D(1, 5), TerrainConfig{}), "single-row grid must be rejected");
    failures += expect_true(throws_invalid_grid(Grid2D(), TerrainConfig{}), "empty grid must be rejected");
    return failures;
}

int test_scheme_factory()
{
    int failures = 0;
    failures += expect_true(create_terrain_scheme("HORN")->name() == "horn", "scheme names are case-insensitive");
    failures += expect_true(create_terrain_scheme("sobel")->name() == "horn", "sobel alias maps to horn");
    failures += expect_true(create_terrain_scheme("4cell")->name() == "central", "4cell alias maps to central");
    failures += expect_true(create_terrain_scheme("unknown_kernel")->name() == "horn", "unknown scheme falls back to horn");
    failures += expect_true(get_available_terrain_schemes().size() == 2, "two terrain schemes are registered");
    return failures;
}

int test_nan_elevation_propagates()
{
    int failures = 0;
    Grid2D z = east_rising_ramp(3, 3, 1.0);
    z(1, 1) = std::nan("");
    const TerrainParameters params = extract_terrain_parameters(z, TerrainConfig{});
    failures += expect_true(std::isnan(params.slope(0, 0)), "NaN neighbour must propagate to slope");
    failures += expect_true(std::isnan(params.aspect(2, 2)), "NaN neighbour must propagate to aspect");
    return failures;
}

} // namespace

int main()
{
    tpc::global_log_profile = tpc::LogProfile::quiet;

    int failures = 0;
    failures += test_linear_ramp_horn();
    failures += test_linear_ramp_central_matches_horn();
    failures += test_cardinal_aspects();
    failures += test_flat_grid();
    failures += test_border_uses_one_sided_difference();
    failures += test_z_scale_and_spacing();
    failures += test_invalid_inputs_throw();
    failures += test_scheme_factory();
    failures += test_nan_elevation_propagates();

    if (failures > 0)
    {
        std::cerr << "[terrain-regression] FAILED with " << failures << " check(s)." << std::endl;
        return 1;
    }

    std::cout << "[terrain-regression] all checks passed" << std::endl;
    return 0;
}
