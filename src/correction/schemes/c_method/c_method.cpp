/**
 * @file c_method.cpp
 * @brief Implementation for the correction module.
 *
 * Parameter estimation and elementwise application of the C-correction.
 */

#include "c_method.hpp"
#include "correction/base/band_guard.hpp"
#include "correction/base/regression.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>

namespace tpc {

CMethodScheme::CMethodScheme()
{
}

void CMethodScheme::initialize(const CorrectionConfig& cfg)
{
    config_ = cfg;

    if (log_normal_enabled())
    {
        std::cout << "Initialized C-correction:" << std::endl;
        std::cout << "  illumination floor: " << config_.illumination_floor << std::endl;
        std::cout << "  sample stride: " << config_.sample_stride << std::endl;
    }
}

/*This function fits the band regression L = m * cos(gi) + b and derives C = b / m.
A non-positive m means radiance does not grow with illumination, and a
non-positive cos(ts) + C flips the sign of every corrected pixel. In both
cases C has no physical meaning and the band is handed to the degenerate policy.*/
BandParameters CMethodScheme::fit(const Grid2D& band,
                                  const Grid2D& illumination,
                                  double cos_sz) const
{
    const auto samples = regression::collect_linear_samples(band, illumination, config_);
    if (regression::distinct_illumination_values(samples) < 2)
    {
        std::ostringstream oss;
        oss << "C-method: " << samples.size()
            << " sample(s) with fewer than 2 distinct illumination values";
        throw InsufficientDataError(oss.str());
    }

    const regression::LinearFit fit = regression::fit_ols(samples);

    BandParameters params;
    params.slope = fit.slope;
    params.intercept = fit.intercept;
    params.r_squared = fit.r_squared;
    params.sample_count = fit.n;

    if (!(fit.slope > 0.0) || !std::isfinite(fit.intercept / fit.slope))
    {
        std::ostringstream oss;
        oss << "regression slope m=" << fit.slope << " is not positive";
        band_guard::mark_degenerate(params, config_, "C-method", oss.str());
        return params;
    }

    const double c = fit.intercept / fit.slope;
    if (!(cos_sz + c > 0.0))
    {
        std::ostringstream oss;
        oss << "cos(solar zenith) + C = " << cos_sz + c << " is not positive (C=" << c << ")";
        band_guard::mark_degenerate(params, config_, "C-method", oss.str());
        return params;
    }

    params.c = c;

    if (log_debug_enabled())
    {
        std::cout << "C-correction parameters: m=" << fit.slope
                  << " b=" << fit.intercept
                  << " C=" << params.c
                  << " r2=" << fit.r_squared
                  << " n=" << fit.n << std::endl;
    }
    return params;
}

/*This function applies the correction.
The denominator cos(gi) + C is floored at the illumination floor; each floored
pixel is counted and the band keeps going.*/
Grid2D CMethodScheme::apply(const Grid2D& band,
                            const Grid2D& illumination,
                            double cos_sz,
                            const BandParameters& params,
                            BandReport& report) const
{
    if (params.identity)
    {
        return band_guard::identity_copy(band, config_, report);
    }

    const int rows = band.rows();
    const int cols = band.cols();
    const double C = params.c;
    const double numerator = cos_sz + C;
    const double floor = config_.illumination_floor;
    const CorrectionConfig& cfg = config_;

    Grid2D out(rows, cols);
    std::size_t clamped = 0;
    std::size_t skipped = 0;

    #pragma omp parallel for collapse(2) reduction(+:clamped, skipped)
    for (int r = 0; r < rows; ++r)
    {
        for (int c = 0; c < cols; ++c)
        {
            const double L = band(r, c);
            const double ci = illumination(r, c);
            if (!regression::is_valid_radiance(L, cfg) || !std::isfinite(ci))
            {
                out(r, c) = L;
                ++skipped;
                continue;
            }

            double denom = ci + C;
            if (denom < floor)
            {
                denom = floor;
                ++clamped;
            }
            out(r, c) = L * numerator / denom;
        }
    }

    report.clamped_pixels += clamped;
    report.skipped_pixels += skipped;
    band_guard::note_singularities(report, config_);
    return out;
}

}
