/**
 * @file c_method.hpp
 * @brief Declarations for the correction module.
 *
 * Teillet C-correction: L_corr = L * (cos ts + C) / (cos gi + C), with
 * C = b / m from the band regression L = m * cos gi + b.
 */

#pragma once
#include "correction_base.hpp"

namespace tpc {

class CMethodScheme : public CorrectionSchemeBase
{
private:
    CorrectionConfig config_;

public:
    CMethodScheme();

    std::string name() const override { return "c"; }

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
