/**
 * @file regression.cpp
 * @brief Implementation for the correction module.
 *
 * Sample collection, least-squares fitting and illumination stratification
 * shared by the C-method, Minnaert and statistical schemes.
 */

#include "regression.hpp"
#include "errors.hpp"
#include "physical_constants.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <tuple>


namespace tpc {
namespace regression {

bool is_valid_radiance(double value, const CorrectionConfig& cfg)
{
    if (!std::isfinite(value))
    {
        return false;
    }
    return !(cfg.has_nodata && value == cfg.nodata_value);
}

/**
 * @brief Collects linear fit samples from lit pixels.
 */
std::vector<FitSample> collect_linear_samples(
    const Grid2D& band,
    const Grid2D& illumination,
    const CorrectionConfig& cfg
)
{
    std::vector<FitSample> samples;
    const int stride = std::max(cfg.sample_stride, 1);
    samples.reserve(band.size() / static_cast<size_t>(stride * stride) + 1);

    for (int r = 0; r < band.rows(); r += stride)
    {
        for (int c = 0; c < band.cols(); c += stride)
        {
            const double L = band(r, c);
            const double ci = illumination(r, c);
            // Self-shadowed pixels carry diffuse light only and bias the fit.
            if (!is_valid_radiance(L, cfg) || !std::isfinite(ci) || ci <= 0.0)
            {
                continue;
            }
            samples.push_back({ci, ci, L});
        }
    }
    return samples;
}

/**
 * @brief Collects log-space samples for the Minnaert exponent.
 */
std::vector<FitSample> collect_log_samples(
    const Grid2D& band,
    const Grid2D& illumination,
    double cos_sz,
    const CorrectionConfig& cfg
)
{
    std::vector<FitSample> samples;
    const int stride = std::max(cfg.sample_stride, 1);
    const double floor = std::max(cfg.illumination_floor, 0.0);
    const double log_cos_sz = std::log(cos_sz);
    samples.reserve(band.size() / static_cast<size_t>(stride * stride) + 1);

    for (int r = 0; r < band.rows(); r += stride)
    {
        for (int c = 0; c < band.cols(); c += stride)
        {
            const double L = band(r, c);
            const double ci = illumination(r, c);
            if (!is_valid_radiance(L, cfg) || L <= 0.0 || !std::isfinite(ci) ||
                ci <= 0.0 || ci < floor)
            {
                continue;
            }
            samples.push_back({ci, std::log(ci), std::log(L) - log_cos_sz});
        }
    }
    return samples;
}

std::size_t distinct_illumination_values(const std::vector<FitSample>& samples)
{
    if (samples.empty())
    {
        return 0;
    }
    double lo = samples.front().illumination;
    double hi = lo;
    for (const auto& s : samples)
    {
        lo = std::min(lo, s.illumination);
        hi = std::max(hi, s.illumination);
    }
    // Rounding noise on a planar surface is not a second illumination value.
    return (hi - lo) > physical_constants::uniform_illumination_tolerance ? 2 : 1;
}

/**
 * @brief Two-pass least squares fit.
 */
LinearFit fit_ols(const std::vector<FitSample>& samples)
{
    const size_t n = samples.size();
    if (n < 2)
    {
        std::ostringstream oss;
        oss << "regression needs at least 2 samples (got " << n << ")";
        throw InsufficientDataError(oss.str());
    }

    double mean_x = 0.0;
    double mean_y = 0.0;
    double min_x = samples.front().x;
    double max_x = min_x;
    for (const auto& s : samples)
    {
        mean_x += s.x;
        mean_y += s.y;
        min_x = std::min(min_x, s.x);
        max_x = std::max(max_x, s.x);
    }
    mean_x /= static_cast<double>(n);
    mean_y /= static_cast<double>(n);

    double sxx = 0.0;
    double sxy = 0.0;
    double syy = 0.0;
    for (const auto& s : samples)
    {
        const double dx = s.x - mean_x;
        const double dy = s.y - mean_y;
        sxx += dx * dx;
        sxy += dx * dy;
        syy += dy * dy;
    }

    if (!(sxx > 0.0) || !(max_x - min_x > physical_constants::uniform_illumination_tolerance))
    {
        throw InsufficientDataError("regression needs at least 2 distinct illumination values");
    }

    LinearFit fit;
    fit.n = n;
    fit.slope = sxy / sxx;
    fit.intercept = mean_y - fit.slope * mean_x;
    fit.r_squared = syy > 0.0 ? (sxy * sxy) / (sxx * syy) : 1.0;
    return fit;
}

/**
 * @brief Reduces samples to per-stratum means.
 */
std::vector<FitSample> stratified_means(
    const std::vector<FitSample>& samples,
    int n_strat
)
{
    if (n_strat < 1)
    {
        throw InvalidConfigError("stratification needs a positive bin count");
    }
    if (distinct_illumination_values(samples) < 2)
    {
        throw InsufficientDataError("stratification needs at least 2 distinct illumination values");
    }

    double lo = samples.front().illumination;
    double hi = lo;
    for (const auto& s : samples)
    {
        lo = std::min(lo, s.illumination);
        hi = std::max(hi, s.illumination);
    }
    const double width = (hi - lo) / static_cast<double>(n_strat);

    std::vector<std::vector<FitSample>> bins(static_cast<size_t>(n_strat));
    for (const auto& s : samples)
    {
        int idx = static_cast<int>((s.illumination - lo) / width);
        idx = std::clamp(idx, 0, n_strat - 1);
        bins[static_cast<size_t>(idx)].push_back(s);
    }

    std::vector<FitSample> means;
    means.reserve(bins.size());
    for (auto& bin : bins)
    {
        if (bin.empty())
        {
            continue;
        }
        std::sort(bin.begin(), bin.end(), [](const FitSample& a, const FitSample& b)
        {
            return std::tie(a.illumination, a.x, a.y) < std::tie(b.illumination, b.x, b.y);
        });

        FitSample m{0.0, 0.0, 0.0};
        for (const auto& s : bin)
        {
            m.illumination += s.illumination;
            m.x += s.x;
            m.y += s.y;
        }
        const double count = static_cast<double>(bin.size());
        m.illumination /= count;
        m.x /= count;
        m.y /= count;
        means.push_back(m);
    }

    if (means.size() < 2)
    {
        throw InsufficientDataError("fewer than 2 non-empty illumination strata");
    }
    return means;
}

double band_mean(const Grid2D& band, const CorrectionConfig& cfg)
{
    double sum = 0.0;
    size_t count = 0;
    for (double v : band)
    {
        if (is_valid_radiance(v, cfg))
        {
            sum += v;
            ++count;
        }
    }
    if (count == 0)
    {
        throw InsufficientDataError("band has no valid pixels");
    }
    return sum / static_cast<double>(count);
}

} // namespace regression
} // namespace tpc
