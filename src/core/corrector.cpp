/**
 * @file corrector.cpp
 * @brief Scene-level correction pipeline.
 *
 * Runs terrain extraction, illumination and the selected correction scheme
 * for every band of a scene, caching per-band parameters.
 */

#include "corrector.hpp"

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "errors.hpp"
#include "logging.hpp"
#include "physical_constants.hpp"

namespace tpc {

namespace {

constexpr const char* flat_terrain_note = "flat terrain";

void check_image_shape(const MultiBandImage& image, const Grid2D& reference, const char* what)
{
    if (image.empty())
    {
        throw InvalidGridError("image has no bands");
    }
    for (std::size_t i = 0; i < image.size(); ++i)
    {
        if (!image[i].same_shape(reference))
        {
            std::ostringstream oss;
            oss << "band " << i << " is " << image[i].rows() << "x" << image[i].cols()
                << " but the " << what << " is " << reference.rows() << "x" << reference.cols();
            throw InvalidGridError(oss.str());
        }
    }
}

}

TopographicCorrector::TopographicCorrector(const CorrectionConfig& cfg,
                                           Grid2D illumination,
                                           const SolarAngles& sun)
    : config_(cfg),
      illumination_(std::move(illumination)),
      sun_(sun),
      cos_sz_(sun.cos_zenith()),
      flat_scene_(false)
{
    validate_correction_config(config_);
    if (illumination_.empty())
    {
        throw InvalidGridError("illumination map is empty");
    }

    scheme_ = create_correction_scheme(config_.method_id);
    scheme_->initialize(config_);
    flat_scene_ = is_flat_illumination(illumination_, sun_);

    if (flat_scene_ && log_normal_enabled())
    {
        std::cout << "Illumination is uniform at cos(zenith)=" << cos_sz_
                  << "; bands pass through unchanged" << std::endl;
    }
}

void TopographicCorrector::check_band_shape(const Grid2D& band, int band_index) const
{
    if (!band.same_shape(illumination_))
    {
        std::ostringstream oss;
        oss << "band " << band_index << " is " << band.rows() << "x" << band.cols()
            << " but the illumination map is " << illumination_.rows() << "x"
            << illumination_.cols();
        throw InvalidGridError(oss.str());
    }
}

const BandParameters& TopographicCorrector::fit_band(int band_index, const Grid2D& band)
{
    const auto cached = cache_.find(band_index);
    if (cached != cache_.end())
    {
        return cached->second;
    }

    check_band_shape(band, band_index);

    BandParameters params;
    if (flat_scene_)
    {
        params.identity = true;
        params.note = flat_terrain_note;
    }
    else
    {
        params = scheme_->fit(band, illumination_, cos_sz_);
    }

    if (log_debug_enabled())
    {
        std::cout << "Band " << band_index << " fitted with " << scheme_->name()
                  << (params.identity ? " (identity)" : "") << std::endl;
    }

    return cache_.emplace(band_index, std::move(params)).first->second;
}

bool TopographicCorrector::has_parameters(int band_index) const
{
    return cache_.find(band_index) != cache_.end();
}

const BandParameters& TopographicCorrector::parameters(int band_index) const
{
    const auto it = cache_.find(band_index);
    if (it == cache_.end())
    {
        throw std::out_of_range("no fitted parameters for band " + std::to_string(band_index));
    }
    return it->second;
}

Grid2D TopographicCorrector::correct_band(int band_index, const Grid2D& band, BandReport* report_opt)
{
    check_band_shape(band, band_index);
    const BandParameters& params = fit_band(band_index, band);

    BandReport local;
    BandReport& report = report_opt ? *report_opt : local;
    report.band_index = band_index;
    report.method = scheme_->name();
    report.params = params;
    if (params.identity && !params.note.empty())
    {
        report.warnings.push_back("identity: " + params.note);
    }

    return scheme_->apply(band, illumination_, cos_sz_, params, report);
}

/*This function corrects every band of the image.
Shapes are checked for all bands up front so that a mismatch never leaves a
partially corrected result behind.*/
CorrectionResult TopographicCorrector::correct(const MultiBandImage& image)
{
    check_image_shape(image, illumination_, "illumination map");

    CorrectionResult result;
    result.illumination = illumination_;
    result.report.method = scheme_->name();
    result.report.solar_zenith_deg = sun_.zenith * physical_constants::rad_to_deg;
    result.report.solar_azimuth_deg = sun_.azimuth * physical_constants::rad_to_deg;
    result.report.illumination = illumination_stats(illumination_);
    result.report.flat_scene = flat_scene_;
    result.corrected.reserve(image.size());
    result.report.bands.reserve(image.size());

    for (std::size_t i = 0; i < image.size(); ++i)
    {
        BandReport band_report;
        result.corrected.push_back(correct_band(static_cast<int>(i), image[i], &band_report));
        result.report.bands.push_back(std::move(band_report));
    }

    if (log_normal_enabled())
    {
        std::cout << "Corrected " << image.size() << " band(s) with " << scheme_->name()
                  << ": identity=" << result.report.identity_band_count()
                  << " clamped=" << result.report.total_clamped_pixels() << std::endl;
    }

    return result;
}

CorrectionResult correct_scene(const Grid2D& elevation,
                               const MultiBandImage& image,
                               const SolarAngles& sun,
                               const TerrainConfig& terrain_cfg,
                               const CorrectionConfig& correction_cfg)
{
    validate_correction_config(correction_cfg);
    check_image_shape(image, elevation, "elevation grid");

    TerrainParameters terrain = extract_terrain_parameters(elevation, terrain_cfg);
    Grid2D illumination = compute_illumination(terrain, sun);

    TopographicCorrector corrector(correction_cfg, std::move(illumination), sun);
    CorrectionResult result = corrector.correct(image);
    result.terrain = std::move(terrain);
    return result;
}

}
