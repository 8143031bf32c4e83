/**
 * @file correction_report.cpp
 * @brief Implementation for the diagnostics module.
 *
 * JSON serialization of per-band correction diagnostics.
 */

#include "correction_report.hpp"
#include "string_utils.hpp"

#include <cmath>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>

namespace tpc {namespace {

/**
 * @brief Emits a number, mapping non-finite values to JSON null.
 */
std::string json_number(double value) {
    if (!std::isfinite(value)) {
        return "null";
    }
    std::ostringstream oss;
    oss << std::setprecision(std::numeric_limits<double>::max_digits10) << value;
    return oss.str();
}

void write_string_array(std::ostringstream& oss, const std::vector<std::string>& values) {
    oss << "[";
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            oss << ", ";
        }
        oss << "\"" << strutil::json_escape(values[i]) << "\"";
    }
    oss << "]";
}

}

std::size_t CorrectionReport::total_clamped_pixels() const {
    std::size_t total = 0;
    for (const auto& band : bands) {
        total += band.clamped_pixels;
    }
    return total;
}

std::size_t CorrectionReport::identity_band_count() const {
    std::size_t count = 0;
    for (const auto& band : bands) {
        if (band.params.identity) {
            ++count;
        }
    }
    return count;
}

/**
 * @brief Serializes the report to a JSON document.
 */
std::string correction_report_to_json(const CorrectionReport& report) {
    std::ostringstream oss;
    oss << "{\n";
    oss << "  \"method\": \"" << strutil::json_escape(report.method) << "\",\n";
    oss << "  \"solar_zenith_deg\": " << json_number(report.solar_zenith_deg) << ",\n";
    oss << "  \"solar_azimuth_deg\": " << json_number(report.solar_azimuth_deg) << ",\n";
    oss << "  \"flat_scene\": " << (report.flat_scene ? "true" : "false") << ",\n";
    oss << "  \"illumination\": {\n";
    oss << "    \"min\": " << json_number(report.illumination.min_value) << ",\n";
    oss << "    \"max\": " << json_number(report.illumination.max_value) << ",\n";
    oss << "    \"mean\": " << json_number(report.illumination.mean_value) << ",\n";
    oss << "    \"shadowed_count\": " << report.illumination.shadowed_count << ",\n";
    oss << "    \"nonfinite_count\": " << report.illumination.nonfinite_count << "\n";
    oss << "  },\n";
    oss << "  \"total_clamped_pixels\": " << report.total_clamped_pixels() << ",\n";

    oss << "  \"bands\": [\n";
    for (std::size_t i = 0; i < report.bands.size(); ++i) {
        const auto& band = report.bands[i];
        const auto& p = band.params;
        oss << "    {\n";
        oss << "      \"band_index\": " << band.band_index << ",\n";
        oss << "      \"method\": \"" << strutil::json_escape(band.method) << "\",\n";
        oss << "      \"identity\": " << (p.identity ? "true" : "false") << ",\n";
        oss << "      \"note\": \"" << strutil::json_escape(p.note) << "\",\n";
        oss << "      \"parameters\": {\n";
        oss << "        \"slope\": " << json_number(p.slope) << ",\n";
        oss << "        \"intercept\": " << json_number(p.intercept) << ",\n";
        oss << "        \"r_squared\": " << json_number(p.r_squared) << ",\n";
        oss << "        \"c\": " << json_number(p.c) << ",\n";
        oss << "        \"k\": " << json_number(p.k) << ",\n";
        oss << "        \"a\": " << json_number(p.a) << ",\n";
        oss << "        \"b\": " << json_number(p.b) << ",\n";
        oss << "        \"mean_radiance\": " << json_number(p.mean_radiance) << ",\n";
        oss << "        \"sample_count\": " << p.sample_count << ",\n";
        oss << "        \"strata_used\": " << p.strata_used << "\n";
        oss << "      },\n";
        oss << "      \"clamped_pixels\": " << band.clamped_pixels << ",\n";
        oss << "      \"skipped_pixels\": " << band.skipped_pixels << ",\n";
        oss << "      \"warnings\": ";
        write_string_array(oss, band.warnings);
        oss << "\n";
        oss << "    }" << (i + 1 < report.bands.size() ? "," : "") << "\n";
    }
    oss << "  ]\n";
    oss << "}\n";
    return oss.str();
}

/**
 * @brief Writes the JSON report to disk.
 */
bool write_correction_report_json(const CorrectionReport& report,
                                  const std::filesystem::path& path,
                                  std::string& error) {
    std::error_code ec;
    const auto parent = path.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            error = "failed to create report directory '" + parent.string() + "': " + ec.message();
            return false;
        }
    }

    std::ofstream out(path);
    if (!out) {
        error = "failed to open report file for writing: " + path.string();
        return false;
    }

    out << correction_report_to_json(report);
    if (!out.good()) {
        error = "failed to write report file: " + path.string();
        return false;
    }

    return true;
}

}
