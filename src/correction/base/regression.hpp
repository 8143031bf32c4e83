#pragma once
#include <cstddef>
#include <vector>

#include "correction_base.hpp"
#include "grid2d.hpp"

// Correction module regression utilities
namespace tpc {
namespace regression {

// One fit sample: raw illumination (used for stratification) and the
// regression coordinates derived from it.
struct FitSample
{
    double illumination;
    double x;
    double y;
};

struct LinearFit
{
    double slope = 0.0;
    double intercept = 0.0;
    double r_squared = 0.0;
    std::size_t n = 0;
};

// Pixel is usable: finite radiance that is not the nodata value
bool is_valid_radiance(double value, const CorrectionConfig& cfg);

// Collect (cos gi, L) pairs from lit, valid pixels on the sampling lattice
std::vector<FitSample> collect_linear_samples(
    const Grid2D& band,
    const Grid2D& illumination,
    const CorrectionConfig& cfg
);

// Collect (log cos gi, log L - log cos ts) pairs; requires L > 0 and cos gi >= floor
std::vector<FitSample> collect_log_samples(
    const Grid2D& band,
    const Grid2D& illumination,
    double cos_sz,
    const CorrectionConfig& cfg
);

// Number of distinct illumination values in the sample, capped at 2.
// Values within uniform_illumination_tolerance of each other count as one.
std::size_t distinct_illumination_values(const std::vector<FitSample>& samples);

// Ordinary least squares y = slope * x + intercept.
// Throws InsufficientDataError when the x range is within uniform_illumination_tolerance.
LinearFit fit_ols(const std::vector<FitSample>& samples);

// Equal-width strata over the illumination range; one mean sample per non-empty bin.
// Members are sorted before summation so the result depends only on the multiset.
std::vector<FitSample> stratified_means(
    const std::vector<FitSample>& samples,
    int n_strat
);

// Mean radiance over every valid pixel of the band
double band_mean(const Grid2D& band, const CorrectionConfig& cfg);

} // namespace regression
} // namespace tpc
