/**
 * @file statistical.hpp
 * @brief Declarations for the correction module.
 *
 * Statistical-empirical correction: the band's linear dependence on
 * illumination is removed and the band mean restored,
 * L_corr = L - (A * cos gi + B) + mean(L).
 */

#pragma once
#include "correction_base.hpp"

namespace tpc {

class StatisticalScheme : public CorrectionSchemeBase
{
private:
    CorrectionConfig config_;

public:
    StatisticalScheme();

    std::string name() const override { return "stat"; }

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
