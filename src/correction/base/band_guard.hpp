#pragma once
#include <string>

#include "correction_base.hpp"

/*Guards shared by the correction schemes: degenerate-parameter policy,
identity pass-through and division-singularity reporting.*/
namespace tpc {
namespace band_guard {

// Applies the degenerate policy: throws under strict, otherwise marks the band identity and warns
void mark_degenerate(
    BandParameters& params,
    const CorrectionConfig& cfg,
    const std::string& method,
    const std::string& reason
);

// Copies the band unchanged, counting nodata/non-finite pixels in the report
Grid2D identity_copy(const Grid2D& band, const CorrectionConfig& cfg, BandReport& report);

// Records one division-singularity warning for the band when any denominator was floored
void note_singularities(BandReport& report, const CorrectionConfig& cfg);

} // namespace band_guard
} // namespace tpc
