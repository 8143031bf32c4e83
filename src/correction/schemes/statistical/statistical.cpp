#include "statistical.hpp"
#include "correction/base/band_guard.hpp"
#include "correction/base/regression.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <cmath>
#include <iostream>
#include <sstream>

/*This file contains the implementation of the statistical-empirical correction scheme.
No illumination term ends up in a denominator, so shadowed pixels are corrected
like any other pixel and nothing is clamped.*/

namespace tpc {

StatisticalScheme::StatisticalScheme()
{
}

void StatisticalScheme::initialize(const CorrectionConfig& cfg)
{
    config_ = cfg;

    if (log_normal_enabled())
    {
        std::cout << "Initialized statistical-empirical correction" << std::endl;
        std::cout << "  sample stride: " << config_.sample_stride << std::endl;
    }
}

BandParameters StatisticalScheme::fit(const Grid2D& band,
                                      const Grid2D& illumination,
                                      double cos_sz) const
{
    (void)cos_sz;
    const auto samples = regression::collect_linear_samples(band, illumination, config_);
    if (regression::distinct_illumination_values(samples) < 2)
    {
        std::ostringstream oss;
        oss << "statistical: " << samples.size()
            << " sample(s) with fewer than 2 distinct illumination values";
        throw InsufficientDataError(oss.str());
    }

    const regression::LinearFit fit = regression::fit_ols(samples);

    BandParameters params;
    params.slope = fit.slope;
    params.intercept = fit.intercept;
    params.r_squared = fit.r_squared;
    params.sample_count = fit.n;
    params.mean_radiance = regression::band_mean(band, config_);

    // Radiance falling as illumination rises has no physical reading.
    if (!std::isfinite(fit.slope) || !std::isfinite(fit.intercept) || fit.slope < 0.0)
    {
        std::ostringstream oss;
        oss << "regression slope A=" << fit.slope << " is negative or non-finite";
        band_guard::mark_degenerate(params, config_, "statistical", oss.str());
        return params;
    }

    params.a = fit.slope;
    params.b = fit.intercept;

    if (log_debug_enabled())
    {
        std::cout << "Statistical parameters: A=" << params.a
                  << " B=" << params.b
                  << " mean=" << params.mean_radiance
                  << " r2=" << fit.r_squared
                  << " n=" << fit.n << std::endl;
    }
    return params;
}

Grid2D StatisticalScheme::apply(const Grid2D& band,
                                const Grid2D& illumination,
                                double cos_sz,
                                const BandParameters& params,
                                BandReport& report) const
{
    (void)cos_sz;
    if (params.identity)
    {
        return band_guard::identity_copy(band, config_, report);
    }

    const int rows = band.rows();
    const int cols = band.cols();
    const double A = params.a;
    const double B = params.b;
    const double mean = params.mean_radiance;
    const CorrectionConfig& cfg = config_;

    Grid2D out(rows, cols);
    std::size_t skipped = 0;

    #pragma omp parallel for collapse(2) reduction(+:skipped)
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
            out(r, c) = L - (A * ci + B) + mean;
        }
    }

    report.skipped_pixels += skipped;
    return out;
}

}
