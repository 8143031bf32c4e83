/**
 * @file factory.cpp
 * @brief Implementation for the correction module.
 *
 * Name normalization, scheme creation and configuration checks for the
 * correction methods.
 */

#include "factory.hpp"
#include "schemes/c_method/c_method.hpp"
#include "schemes/minnaert/minnaert.hpp"
#include "schemes/statistical/statistical.hpp"
#include "errors.hpp"
#include "string_utils.hpp"

#include <cmath>
#include <sstream>

namespace tpc {

/**
 * @brief Normalizes correction method aliases to canonical identifiers.
 */
std::string normalize_correction_method_name(const std::string& method_name)
{
    const std::string v = strutil::lower_copy(strutil::trim_copy(method_name));
    if (v == "c" || v == "c_method" || v == "c-method" || v == "cmethod" ||
        v == "c_correction" || v == "c-correction")
    {
        return "c";
    }
    if (v == "minnaert")
    {
        return "minnaert";
    }
    if (v == "stat" || v == "statistical" || v == "statistical_empirical" ||
        v == "statistical-empirical" || v == "se")
    {
        return "stat";
    }
    return "";
}

/**
 * @brief Creates the correction scheme.
 */
std::unique_ptr<CorrectionSchemeBase> create_correction_scheme(const std::string& method_name)
{
    const std::string normalized = normalize_correction_method_name(method_name);

    if (normalized == "c")
    {
        return std::make_unique<CMethodScheme>();
    }
    else if (normalized == "minnaert")
    {
        return std::make_unique<MinnaertScheme>();
    }
    else if (normalized == "stat")
    {
        return std::make_unique<StatisticalScheme>();
    }
    else
    {
        throw InvalidConfigError("Unknown correction method: " + method_name);
    }
}

/**
 * @brief Gets the available correction schemes.
 */
std::vector<std::string> get_available_correction_schemes()
{
    return {"c", "minnaert", "stat"};
}

bool parse_degenerate_policy(const std::string& value, DegeneratePolicy& out_policy)
{
    const std::string v = strutil::lower_copy(strutil::trim_copy(value));
    if (v == "identity" || v == "fallback" || v == "warn")
    {
        out_policy = DegeneratePolicy::identity;
        return true;
    }
    if (v == "strict" || v == "error")
    {
        out_policy = DegeneratePolicy::strict;
        return true;
    }
    return false;
}

const char* to_string(DegeneratePolicy policy)
{
    switch (policy)
    {
        case DegeneratePolicy::strict:
            return "strict";
        case DegeneratePolicy::identity:
        default:
            return "identity";
    }
}

/**
 * @brief Rejects configurations the schemes cannot run with.
 */
void validate_correction_config(const CorrectionConfig& cfg)
{
    if (normalize_correction_method_name(cfg.method_id).empty())
    {
        throw InvalidConfigError("Unknown correction method: " + cfg.method_id);
    }
    if (cfg.n_strat < 0 || cfg.n_strat == 1)
    {
        std::ostringstream oss;
        oss << "n_strat must be 0 (off) or at least 2 (got " << cfg.n_strat << ")";
        throw InvalidConfigError(oss.str());
    }
    if (!std::isfinite(cfg.illumination_floor) || cfg.illumination_floor <= 0.0)
    {
        std::ostringstream oss;
        oss << "illumination_floor must be positive (got " << cfg.illumination_floor << ")";
        throw InvalidConfigError(oss.str());
    }
    if (cfg.sample_stride < 1)
    {
        std::ostringstream oss;
        oss << "sample_stride must be at least 1 (got " << cfg.sample_stride << ")";
        throw InvalidConfigError(oss.str());
    }
    if (cfg.has_nodata && !std::isfinite(cfg.nodata_value))
    {
        throw InvalidConfigError("nodata value must be finite");
    }
}

}
