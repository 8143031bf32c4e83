/**
 * @file minnaert.hpp
 * @brief Declarations for the correction module.
 *
 * Minnaert correction: L_corr = L * (cos ts / cos gi)^k.
 */

#pragma once
#include "correction_base.hpp"

namespace tpc {

/**
 * @brief Minnaert correction with optional illumination stratification.
 *
 * k is the slope of log(L) - log(cos ts) against log(cos gi). With
 * n_strat >= 2 the sample is first reduced to the means of n_strat
 * equal-width illumination strata so that densely populated illumination
 * ranges do not dominate the fit.
 */
class MinnaertScheme : public CorrectionSchemeBase
{
private:
    CorrectionConfig config_;

public:
    MinnaertScheme();

    std::string name() const override { return "minnaert"; }

    void initialize(const CorrectionConfig& cfg) override;

    BandParameters fit(const Grid2D& band,
                       const Grid2D& illumination,
                       double cos_sz) const override;

    Grid2D apply(const Grid2D& band,
                 const Grid2D& illumination,
                 double cos_sz,
                 const BandParameters& params,
                 BandReport& report) const override;
};

}
