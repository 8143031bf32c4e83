/**
 * @file band_guard.cpp
 * @brief Implementation for the correction module.
 */

#include "band_guard.hpp"
#include "regression.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <sstream>


namespace tpc {
namespace band_guard {

void mark_degenerate(
    BandParameters& params,
    const CorrectionConfig& cfg,
    const std::string& method,
    const std::string& reason
)
{
    if (cfg.degenerate_policy == DegeneratePolicy::strict)
    {
        throw DegenerateParameterError(method + ": " + reason);
    }
    params.identity = true;
    params.note = reason;
    log_warning(method + ": " + reason + "; band left uncorrected.");
}

Grid2D identity_copy(const Grid2D& band, const CorrectionConfig& cfg, BandReport& report)
{
    Grid2D out(band);
    for (double v : band)
    {
        if (!regression::is_valid_radiance(v, cfg))
        {
            ++report.skipped_pixels;
        }
    }
    return out;
}

void note_singularities(BandReport& report, const CorrectionConfig& cfg)
{
    if (report.clamped_pixels == 0)
    {
        return;
    }
    std::ostringstream oss;
    oss << "division singularity: " << report.clamped_pixels
        << " pixel(s) with denominator below floor " << cfg.illumination_floor
        << " were clamped";
    report.warnings.push_back(oss.str());

    std::ostringstream log;
    log << report.method;
    if (report.band_index >= 0)
    {
        log << " band " << report.band_index;
    }
    log << ": " << oss.str() << ".";
    log_warning(log.str());
}

} // namespace band_guard
} // namespace tpc
