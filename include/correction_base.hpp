#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "grid2d.hpp"
#include "physical_constants.hpp"

/*This header file contains the base classes and structures for the correction module.
The correction module turns raw band radiance into topographically normalized radiance.
The correction method is chosen by name in the configuration.
Each method estimates per-band parameters by regression against the illumination map
and then applies an elementwise transform.*/

namespace tpc
{

enum class DegeneratePolicy
{
    identity,  // log a warning and return the band unchanged
    strict     // throw DegenerateParameterError
};

// Configuration for correction schemes
struct CorrectionConfig
{
    std::string method_id = "c";
    int n_strat = 0;                   // Minnaert strata, 0 disables stratification
    double illumination_floor = physical_constants::default_illumination_floor;
    bool has_nodata = false;
    double nodata_value = 0.0;
    int sample_stride = 1;             // row/column step when collecting fit samples
    DegeneratePolicy degenerate_policy = DegeneratePolicy::identity;
};

// Fitted parameters for one band. Unused fields stay at zero for a given method.
struct BandParameters
{
    double slope = 0.0;          // regression slope (m, k or A)
    double intercept = 0.0;      // regression intercept (b or B)
    double r_squared = 0.0;
    double c = 0.0;              // C-method
    double k = 0.0;              // Minnaert exponent
    double a = 0.0;              // statistical slope
    double b = 0.0;              // statistical intercept
    double mean_radiance = 0.0;  // statistical band mean
    std::size_t sample_count = 0;
    std::size_t strata_used = 0;
    bool identity = false;       // band falls back to no correction
    std::string note;            // why identity was chosen
};

// Per-band diagnostics collected while fitting and applying
struct BandReport
{
    int band_index = -1;
    std::string method;
    BandParameters params;
    std::size_t clamped_pixels = 0;   // denominators raised to the illumination floor
    std::size_t skipped_pixels = 0;   // nodata or non-finite, copied through unchanged
    std::vector<std::string> warnings;
};

// Abstract base class for correction schemes
class CorrectionSchemeBase
{
public:
    virtual ~CorrectionSchemeBase() = default;

    virtual std::string name() const = 0;

    virtual void initialize(const CorrectionConfig& cfg) = 0;

    /**
     * @brief Estimates band parameters from radiance and illumination.
     * @param band Raw band radiance.
     * @param illumination cos(incidence) map with the band's shape.
     * @param cos_sz Cosine of the solar zenith.
     * @return Fitted parameters; identity is set when they are degenerate.
     * @throws InsufficientDataError when fewer than two distinct illumination
     *         values survive sampling.
     * @throws DegenerateParameterError under the strict policy.
     */
    virtual BandParameters fit(const Grid2D& band,
                               const Grid2D& illumination,
                               double cos_sz) const = 0;

    /**
     * @brief Applies the correction with the given parameters.
     *
     * Pure elementwise transform. Nodata and non-finite pixels are copied
     * through; floored denominators are counted in the report.
     */
    virtual Grid2D apply(const Grid2D& band,
                         const Grid2D& illumination,
                         double cos_sz,
                         const BandParameters& params,
                         BandReport& report) const = 0;
};

/**
 * @brief Creates a correction scheme by name.
 * @throws InvalidConfigError for an unknown method.
 */
std::unique_ptr<CorrectionSchemeBase> create_correction_scheme(const std::string& method_name);

/**
 * @brief Lists registered correction methods.
 */
std::vector<std::string> get_available_correction_schemes();

/**
 * @brief Resolves method aliases (c_method, stat, statistical, ...) to canonical ids.
 * @return Canonical id, or an empty string when unknown.
 */
std::string normalize_correction_method_name(const std::string& method_name);

/**
 * @brief Parses the degenerate-parameter policy from text.
 */
bool parse_degenerate_policy(const std::string& value, DegeneratePolicy& out_policy);

const char* to_string(DegeneratePolicy policy);

/**
 * @brief Checks a configuration for values unusable at run time.
 * @throws InvalidConfigError on unknown method, n_strat of 1 or below zero,
 *         non-positive floor, or non-positive stride.
 */
void validate_correction_config(const CorrectionConfig& cfg);

} // namespace tpc
