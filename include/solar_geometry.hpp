#pragma once

#include <string>

/**
 * @file solar_geometry.hpp
 * @brief Scene-constant solar angles supplied by an external provider.
 *
 * The library does not compute solar position; callers read elevation or
 * zenith and azimuth from scene metadata and hand them in with an explicit
 * unit. Everything downstream works in radians.
 */

namespace tpc
{

enum class AngleUnit
{
    degrees,
    radians
};

struct SolarInputConfig
{
    AngleUnit angle_unit = AngleUnit::degrees;
};

/**
 * @brief Solar zenith and azimuth for one capture, in radians.
 *
 * azimuth is a compass bearing from the observer to the sun, clockwise from
 * north, in [0, 2*pi). zenith lies in [0, pi/2).
 */
struct SolarAngles
{
    double zenith = 0.0;
    double azimuth = 0.0;

    double elevation() const;
    double cos_zenith() const;
};

/**
 * @brief Builds solar angles from elevation above the horizon.
 * @throws InvalidConfigError for non-finite input or a sun at/below the horizon.
 */
SolarAngles make_solar_angles_from_elevation(double elevation, double azimuth, AngleUnit unit);

/**
 * @brief Builds solar angles from the zenith angle.
 * @throws InvalidConfigError for non-finite input or zenith outside [0, 90deg).
 */
SolarAngles make_solar_angles_from_zenith(double zenith, double azimuth, AngleUnit unit);

/**
 * @brief Converts a value in the given unit to radians.
 */
double to_radians(double value, AngleUnit unit);

/**
 * @brief Parses an angle unit label (degrees/deg/radians/rad).
 * @return True on success.
 */
bool parse_angle_unit(const std::string& value, AngleUnit& out_unit);

const char* to_string(AngleUnit unit);

} // namespace tpc
