#pragma once

#include <map>
#include <memory>
#include <string>

#include "correction_base.hpp"
#include "correction_report.hpp"
#include "grid2d.hpp"
#include "illumination.hpp"
#include "solar_geometry.hpp"
#include "terrain_base.hpp"

/**
 * @file corrector.hpp
 * @brief Scene-level topographic correction API.
 *
 * TopographicCorrector binds one correction method to one scene (its
 * illumination map and solar angles) and caches fitted parameters per band
 * index for the lifetime of the object. correct_scene() runs the whole
 * DEM -> terrain -> illumination -> correction chain.
 */

namespace tpc
{

struct CorrectionResult
{
    MultiBandImage corrected;
    Grid2D illumination;
    TerrainParameters terrain;
    CorrectionReport report;
};

class TopographicCorrector
{
public:
    /**
     * @brief Binds a correction method to a scene.
     * @param cfg Correction configuration, validated on construction.
     * @param illumination Scene illumination map.
     * @param sun Scene solar angles.
     * @throws InvalidConfigError for unusable configuration.
     * @throws InvalidGridError for an empty illumination map.
     */
    TopographicCorrector(const CorrectionConfig& cfg, Grid2D illumination, const SolarAngles& sun);

    /**
     * @brief Fits and caches parameters for a band index; returns the cached
     *        entry when the index was fitted before.
     */
    const BandParameters& fit_band(int band_index, const Grid2D& band);

    bool has_parameters(int band_index) const;

    /**
     * @brief Returns cached parameters.
     * @throws std::out_of_range when the band index was never fitted.
     */
    const BandParameters& parameters(int band_index) const;

    /**
     * @brief Corrects one band, fitting it first on cache miss.
     * @param report_opt Optional per-band diagnostics output.
     */
    Grid2D correct_band(int band_index, const Grid2D& band, BandReport* report_opt = nullptr);

    /**
     * @brief Corrects every band of an image.
     * @throws InvalidGridError when the image is empty or any band's shape
     *         differs from the illumination map; no band is processed then.
     */
    CorrectionResult correct(const MultiBandImage& image);

    /**
     * @brief Drops every cached band parameter.
     */
    void clear_cache() { cache_.clear(); }

    const Grid2D& illumination() const { return illumination_; }
    const SolarAngles& solar() const { return sun_; }
    const CorrectionConfig& config() const { return config_; }
    std::string method() const { return scheme_->name(); }

    /**
     * @brief True when the illumination map equals cos(zenith) everywhere.
     */
    bool flat_scene() const { return flat_scene_; }

private:
    void check_band_shape(const Grid2D& band, int band_index) const;

    CorrectionConfig config_;
    Grid2D illumination_;
    SolarAngles sun_;
    double cos_sz_;
    bool flat_scene_;
    std::unique_ptr<CorrectionSchemeBase> scheme_;
    std::map<int, BandParameters> cache_;
};

/**
 * @brief Runs the full correction chain for one scene.
 * @param elevation DEM co-registered with the image.
 * @param image Raw multi-band radiance.
 * @param sun Scene solar angles.
 * @param terrain_cfg Terrain extraction settings (cell spacing, scheme).
 * @param correction_cfg Correction settings.
 * @return Corrected bands plus the intermediate grids and the report.
 * @throws InvalidGridError, InvalidConfigError, InsufficientDataError,
 *         DegenerateParameterError.
 */
CorrectionResult correct_scene(const Grid2D& elevation,
                               const MultiBandImage& image,
                               const SolarAngles& sun,
                               const TerrainConfig& terrain_cfg,
                               const CorrectionConfig& correction_cfg);

} // namespace tpc
