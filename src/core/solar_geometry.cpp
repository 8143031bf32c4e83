/**
 * @file solar_geometry.cpp
 * @brief Boundary conversion for externally supplied solar angles.
 */

#include "solar_geometry.hpp"
#include "errors.hpp"
#include "physical_constants.hpp"
#include "string_utils.hpp"
#include "terrain/base/gradient.hpp"

#include <cmath>
#include <sstream>

namespace tpc
{

double SolarAngles::elevation() const
{
    return physical_constants::half_pi - zenith;
}

double SolarAngles::cos_zenith() const
{
    return std::cos(zenith);
}

double to_radians(double value, AngleUnit unit)
{
    return unit == AngleUnit::degrees ? value * physical_constants::deg_to_rad : value;
}

/**
 * @brief Converts and validates zenith/azimuth in the given unit.
 */
SolarAngles make_solar_angles_from_zenith(double zenith, double azimuth, AngleUnit unit)
{
    if (!std::isfinite(zenith) || !std::isfinite(azimuth))
    {
        throw InvalidConfigError("solar angles must be finite");
    }

    SolarAngles angles;
    angles.zenith = to_radians(zenith, unit);
    angles.azimuth = gradient::normalize_bearing(to_radians(azimuth, unit));

    if (angles.zenith < 0.0 || angles.zenith >= physical_constants::half_pi)
    {
        std::ostringstream oss;
        oss << "solar zenith " << zenith << " " << to_string(unit)
            << " places the sun outside the upper hemisphere";
        throw InvalidConfigError(oss.str());
    }
    return angles;
}

SolarAngles make_solar_angles_from_elevation(double elevation, double azimuth, AngleUnit unit)
{
    if (!std::isfinite(elevation))
    {
        throw InvalidConfigError("solar elevation must be finite");
    }
    const double right_angle = unit == AngleUnit::degrees ? 90.0 : physical_constants::half_pi;
    return make_solar_angles_from_zenith(right_angle - elevation, azimuth, unit);
}

bool parse_angle_unit(const std::string& value, AngleUnit& out_unit)
{
    const std::string v = strutil::lower_copy(strutil::trim_copy(value));
    if (v == "degrees" || v == "degree" || v == "deg")
    {
        out_unit = AngleUnit::degrees;
        return true;
    }
    if (v == "radians" || v == "radian" || v == "rad")
    {
        out_unit = AngleUnit::radians;
        return true;
    }
    return false;
}

const char* to_string(AngleUnit unit)
{
    switch (unit)
    {
        case AngleUnit::radians:
            return "radians";
        case AngleUnit::degrees:
        default:
            return "degrees";
    }
}

} // namespace tpc
