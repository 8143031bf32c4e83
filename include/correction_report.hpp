#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "correction_base.hpp"
#include "illumination.hpp"

/**
 * @file correction_report.hpp
 * @brief Per-scene diagnostic report for a correction run.
 *
 * Collects the fitted parameters, clamped and skipped pixel counts and
 * warnings of every band together with scene-level illumination statistics.
 * The report can be serialized to JSON for inspection next to the output.
 */

namespace tpc
{

struct CorrectionReport
{
    std::string method;
    double solar_zenith_deg = 0.0;
    double solar_azimuth_deg = 0.0;
    IlluminationStats illumination;
    bool flat_scene = false;
    std::vector<BandReport> bands;

    /**
     * @brief Sums clamped-pixel counts over all bands.
     */
    std::size_t total_clamped_pixels() const;

    /**
     * @brief Counts bands that fell back to the identity correction.
     */
    std::size_t identity_band_count() const;
};

/**
 * @brief Serializes a correction report to JSON.
 */
std::string correction_report_to_json(const CorrectionReport& report);

/**
 * @brief Writes a correction report to a JSON file, creating parent directories.
 * @param error Receives a message when writing fails.
 * @return True on success.
 */
bool write_correction_report_json(const CorrectionReport& report,
                                  const std::filesystem::path& path,
                                  std::string& error);

} // namespace tpc
