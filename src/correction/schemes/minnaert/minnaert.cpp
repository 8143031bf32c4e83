#include "minnaert.hpp"
#include "correction/base/band_guard.hpp"
#include "correction/base/regression.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>

/*This file contains the implementation of the Minnaert correction scheme.
It manages the estimation of the Minnaert exponent and its per-pixel application.*/

namespace tpc {

MinnaertScheme::MinnaertScheme()
{
}

void MinnaertScheme::initialize(const CorrectionConfig& cfg)
{
    config_ = cfg;

    if (log_normal_enabled())
    {
        std::cout << "Initialized Minnaert correction:" << std::endl;
        if (config_.n_strat >= 2)
        {
            std::cout << "  strata: " << config_.n_strat << " (equal-width)" << std::endl;
        }
        else
        {
            std::cout << "  strata: off" << std::endl;
        }
        std::cout << "  illumination floor: " << config_.illumination_floor << std::endl;
    }
}

/*This function estimates k.
Takes in the band, the illumination map and cos(ts), and regresses in log space.*/
BandParameters MinnaertScheme::fit(const Grid2D& band,
                                   const Grid2D& illumination,
                                   double cos_sz) const
{
    const auto samples = regression::collect_log_samples(band, illumination, cos_sz, config_);
    if (regression::distinct_illumination_values(samples) < 2)
    {
        std::ostringstream oss;
        oss << "Minnaert: " << samples.size()
            << " sample(s) with fewer than 2 distinct illumination values";
        throw InsufficientDataError(oss.str());
    }

    BandParameters params;
    regression::LinearFit fit;
    if (config_.n_strat >= 2)
    {
        const auto strata = regression::stratified_means(samples, config_.n_strat);
        fit = regression::fit_ols(strata);
        params.strata_used = strata.size();
    }
    else
    {
        fit = regression::fit_ols(samples);
    }

    params.slope = fit.slope;
    params.intercept = fit.intercept;
    params.r_squared = fit.r_squared;
    params.sample_count = samples.size();

    if (!std::isfinite(fit.slope) || fit.slope <= 0.0)
    {
        std::ostringstream oss;
        oss << "exponent k=" << fit.slope << " is not positive";
        band_guard::mark_degenerate(params, config_, "Minnaert", oss.str());
        return params;
    }

    params.k = fit.slope;

    if (log_debug_enabled())
    {
        std::cout << "Minnaert parameters: k=" << params.k
                  << " r2=" << fit.r_squared
                  << " n=" << params.sample_count
                  << " strata=" << params.strata_used << std::endl;
    }
    return params;
}

/*This function applies (cos ts / cos gi)^k.
cos(gi) below the illumination floor is raised to the floor and counted.*/
Grid2D MinnaertScheme::apply(const Grid2D& band,
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
    const double k = params.k;
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
            double ci = illumination(r, c);
            if (!regression::is_valid_radiance(L, cfg) || !std::isfinite(ci))
            {
                out(r, c) = L;
                ++skipped;
                continue;
            }

            if (ci < floor)
            {
                ci = floor;
                ++clamped;
            }
            out(r, c) = L * std::pow(cos_sz / ci, k);
        }
    }

    report.clamped_pixels += clamped;
    report.skipped_pixels += skipped;
    band_guard::note_singularities(report, config_);
    return out;
}

}
