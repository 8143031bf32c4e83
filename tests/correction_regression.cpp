#include "correction_base.hpp"
#include "correction/base/regression.hpp"
#include "errors.hpp"
#include "logging.hpp"

#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace
{
using namespace tpc;

constexpr double kCosSz = 0.8;

bool nearly_equal(double a, double b, double tol = 1.0e-12)
{
    return std::abs(a - b) <= tol;
}

int expect_true(bool cond, const std::string& message)
{
    if (!cond)
    {
        std::cerr << "[correction-regression] FAIL: " << message << std::endl;
        return 1;
    }
    return 0;
}

int expect_close(double actual, double expected, const std::string& label, double tol = 1.0e-12)
{
    if (!nearly_equal(actual, expected, tol))
    {
        std::cerr << "[correction-regression] FAIL: " << label
                  << " actual=" << actual
                  << " expected=" << expected
                  << " tol=" << tol << std::endl;
        return 1;
    }
    return 0;
}

// Illumination ramp 0.30 .. 0.87 over a 4x5 scene.
Grid2D ramp_illumination()
{
    Grid2D illum(4, 5);
    for (int r = 0; r < 4; ++r)
    {
        for (int c = 0; c < 5; ++c)
        {
            illum(r, c) = 0.30 + 0.03 * (r * 5 + c);
        }
    }
    return illum;
}

Grid2D linear_band(const Grid2D& illum, double slope, double intercept)
{
    Grid2D band(illum.rows(), illum.cols());
    for (int r = 0; r < illum.rows(); ++r)
    {
        for (int c = 0; c < illum.cols(); ++c)
        {
            band(r, c) = slope * illum(r, c) + intercept;
        }
    }
    return band;
}

std::unique_ptr<CorrectionSchemeBase> make_scheme(const std::string& method, const CorrectionConfig& base = CorrectionConfig{})
{
    CorrectionConfig cfg = base;
    cfg.method_id = method;
    auto scheme = create_correction_scheme(method);
    scheme->initialize(cfg);
    return scheme;
}

int test_c_method_fit_and_apply()
{
    int failures = 0;
    const Grid2D illum = ramp_illumination();
    const Grid2D band = linear_band(illum, 50.0, 20.0);

    auto scheme = make_scheme("c_method");
    failures += expect_true(scheme->name() == "c", "c_method alias resolves to c");

    const BandParameters params = scheme->fit(band, illum, kCosSz);
    failures += expect_close(params.slope, 50.0, "C-method regression slope", 1.0e-9);
    failures += expect_close(params.intercept, 20.0, "C-method regression intercept", 1.0e-9);
    failures += expect_close(params.c, 0.4, "C = b / m", 1.0e-10);
    failures += expect_close(params.r_squared, 1.0, "perfect linear fit", 1.0e-12);
    failures += expect_true(params.sample_count == 20, "every pixel sampled");
    failures += expect_true(!params.identity, "well-posed band is not identity");

    BandReport report;
    const Grid2D out = scheme->apply(band, illum, kCosSz, params, report);
    // (m ci + b)(cos ts + C) / (ci + C) = m (cos ts + C)
    const double expected = 50.0 * (kCosSz + 0.4);
    for (double v : out)
    {
        failures += expect_close(v, expected, "C-corrected linear band is constant", 1.0e-9);
    }
    failures += expect_true(report.clamped_pixels == 0, "no clamping on a lit band");
    failures += expect_true(report.warnings.empty(), "no warnings on a lit band");
    return failures;
}

int test_c_method_large_c_is_identity()
{
    int failures = 0;
    const Grid2D illum = ramp_illumination();
    const Grid2D band = linear_band(illum, 12.0, 3.0);
    auto scheme = make_scheme("c");

    BandParameters params;
    params.c = 1.0e12;
    BandReport report;
    const Grid2D out = scheme->apply(band, illum, kCosSz, params, report);
    for (int i = 0; i < 20; ++i)
    {
        const double L = band.data()[i];
        failures += expect_close(out.data()[i], L, "C -> infinity converges to identity", 1.0e-9 * L);
    }
    return failures;
}

int test_minnaert_limits()
{
    int failures = 0;
    const Grid2D illum = ramp_illumination();
    const Grid2D band = linear_band(illum, 40.0, 5.0);
    auto scheme = make_scheme("minnaert");

    BandParameters k0;
    k0.k = 0.0;
    BandReport r0;
    const Grid2D out0 = scheme->apply(band, illum, kCosSz, k0, r0);
    for (int i = 0; i < 20; ++i)
    {
        failures += expect_true(out0.data()[i] == band.data()[i], "Minnaert k = 0 is identity");
    }

    BandParameters k1;
    k1.k = 1.0;
    BandReport r1;
    const Grid2D out1 = scheme->apply(band, illum, kCosSz, k1, r1);
    for (int i = 0; i < 20; ++i)
    {
        const double expected = band.data()[i] * kCosSz / illum.data()[i];
        failures += expect_close(out1.data()[i], expected, "Minnaert k = 1 is L cos ts / cos gi", 1.0e-12 * expected);
    }
    return failures;
}

int test_minnaert_fit_recovers_exponent()
{
    int failures = 0;
    const Grid2D illum = ramp_illumination();
    Grid2D band(4, 5);
    for (int i = 0; i < 20; ++i)
    {
        band.data()[i] = 100.0 * std::pow(illum.data()[i], 0.7);
    }

    auto plain = make_scheme("minnaert");
    const BandParameters p = plain->fit(band, illum, kCosSz);
    failures += expect_close(p.k, 0.7, "Minnaert k from power-law band", 1.0e-10);
    failures += expect_true(p.strata_used == 0, "no strata without n_strat");

    CorrectionConfig strat_cfg;
    strat_cfg.n_strat = 4;
    auto stratified = make_scheme("minnaert", strat_cfg);
    const BandParameters ps = stratified->fit(band, illum, kCosSz);
    failures += expect_close(ps.k, 0.7, "stratified Minnaert k on collinear data", 1.0e-10);
    failures += expect_true(ps.strata_used >= 2 && ps.strata_used <= 4, "strata count bounded by n_strat");
    failures += expect_true(ps.sample_count == 20, "stratified fit reports raw sample count");
    return failures;
}

int test_stratification_order_independent()
{
    int failures = 0;
    std::vector<regression::FitSample> samples;
    for (int i = 0; i < 40; ++i)
    {
        const double ci = 0.2 + 0.7 * ((i * 17) % 40) / 40.0;
        const double noise = ((i * 7) % 5 - 2) * 0.013;
        samples.push_back({ci, std::log(ci), 0.6 * std::log(ci) + 3.0 + noise});
    }

    std::vector<regression::FitSample> reversed(samples.rbegin(), samples.rend());
    std::vector<regression::FitSample> rotated = samples;
    std::rotate(rotated.begin(), rotated.begin() + 13, rotated.end());

    const auto a = regression::stratified_means(samples, 5);
    const auto b = regression::stratified_means(reversed, 5);
    const auto c = regression::stratified_means(rotated, 5);
    failures += expect_true(a.size() == b.size() && a.size() == c.size(), "stratum count independent of order");
    for (std::size_t i = 0; i < a.size() && i < b.size() && i < c.size(); ++i)
    {
        failures += expect_true(a[i].x == b[i].x && a[i].y == b[i].y, "reversed order gives identical stratum means");
        failures += expect_true(a[i].x == c[i].x && a[i].y == c[i].y, "rotated order gives identical stratum means");
    }

    const regression::LinearFit fa = regression::fit_ols(a);
    const regression::LinearFit fb = regression::fit_ols(b);
    failures += expect_true(fa.slope == fb.slope && fa.intercept == fb.intercept, "stratified fit independent of order");
    return failures;
}

int test_statistical_exact_recovery()
{
    int failures = 0;
    const Grid2D illum = ramp_illumination();
    const Grid2D band = linear_band(illum, 30.0, 5.0);
    auto scheme = make_scheme("statistical");
    failures += expect_true(scheme->name() == "stat", "statistical alias resolves to stat");

    const BandParameters params = scheme->fit(band, illum, kCosSz);
    failures += expect_close(params.a, 30.0, "statistical A", 1.0e-9);
    failures += expect_close(params.b, 5.0, "statistical B", 1.0e-9);

    double mean = 0.0;
    for (double v : band)
    {
        mean += v;
    }
    mean /= static_cast<double>(band.size());
    failures += expect_close(params.mean_radiance, mean, "statistical band mean", 1.0e-12);

    BandReport report;
    const Grid2D out = scheme->apply(band, illum, kCosSz, params, report);
    for (double v : out)
    {
        failures += expect_close(v, mean, "linear band corrects to its mean", 1.0e-9);
    }
    return failures;
}

int test_degenerate_fallback_and_strict()
{
    int failures = 0;
    const Grid2D illum = ramp_illumination();
    // Radiance falls as illumination rises.
    const Grid2D band = linear_band(illum, -10.0, 50.0);

    for (const std::string method : {"c", "minnaert", "stat"})
    {
        auto scheme = make_scheme(method);
        const BandParameters params = scheme->fit(band, illum, kCosSz);
        failures += expect_true(params.identity, method + ": degenerate fit falls back to identity");
        failures += expect_true(!params.note.empty(), method + ": identity carries a reason");

        BandReport report;
        const Grid2D out = scheme->apply(band, illum, kCosSz, params, report);
        for (int i = 0; i < 20; ++i)
        {
            failures += expect_true(out.data()[i] == band.data()[i], method + ": identity band is unchanged");
        }

        CorrectionConfig strict;
        strict.degenerate_policy = DegeneratePolicy::strict;
        auto strict_scheme = make_scheme(method, strict);
        bool threw = false;
        try
        {
            (void)strict_scheme->fit(band, illum, kCosSz);
        }
        catch (const DegenerateParameterError&)
        {
            threw = true;
        }
        failures += expect_true(threw, method + ": strict policy throws DegenerateParameterError");
    }
    return failures;
}

int test_c_method_sign_flip_is_degenerate()
{
    int failures = 0;
    // Illumination 0.62 .. 0.905; L = 100 ci - 60 gives C = -0.6, so cos(ts) + C < 0.
    Grid2D illum(4, 5);
    for (int i = 0; i < 20; ++i)
    {
        illum.data()[i] = 0.62 + 0.015 * i;
    }
    const Grid2D band = linear_band(illum, 100.0, -60.0);
    const double cos_sz = 0.5;

    auto scheme = make_scheme("c");
    const BandParameters params = scheme->fit(band, illum, cos_sz);
    failures += expect_true(params.identity, "non-positive cos(ts) + C falls back to identity");
    failures += expect_true(!params.note.empty(), "sign-flip identity carries a reason");
    failures += expect_close(params.slope, 100.0, "regression slope still reported", 1.0e-9);

    BandReport report;
    const Grid2D out = scheme->apply(band, illum, cos_sz, params, report);
    for (int i = 0; i < 20; ++i)
    {
        failures += expect_true(out.data()[i] == band.data()[i], "sign-flip band is left unchanged");
    }

    CorrectionConfig strict;
    strict.degenerate_policy = DegeneratePolicy::strict;
    auto strict_scheme = make_scheme("c", strict);
    bool threw = false;
    try
    {
        (void)strict_scheme->fit(band, illum, cos_sz);
    }
    catch (const DegenerateParameterError&)
    {
        threw = true;
    }
    failures += expect_true(threw, "strict policy rejects non-positive cos(ts) + C");
    return failures;
}

int test_insufficient_data()
{
    int failures = 0;
    const Grid2D uniform(3, 3, 0.6);
    const Grid2D shadowed(3, 3, -0.2);
    const Grid2D band(3, 3, 42.0);
    // Differences at the level of rounding noise.
    Grid2D jittered(3, 3, 0.6);
    jittered(0, 0) = 0.6 + 1.0e-16;
    jittered(2, 2) = 0.6 - 1.0e-16;

    for (const std::string method : {"c", "minnaert", "stat"})
    {
        auto scheme = make_scheme(method);
        for (const Grid2D* illum : std::initializer_list<const Grid2D*>{&uniform, &shadowed, &jittered})
        {
            bool threw = false;
            try
            {
                (void)scheme->fit(band, *illum, kCosSz);
            }
            catch (const InsufficientDataError&)
            {
                threw = true;
            }
            failures += expect_true(threw, method + ": fewer than two illumination values throws InsufficientDataError");
        }
    }
    return failures;
}

int test_singularity_clamping()
{
    int failures = 0;
    Grid2D illum = ramp_illumination();
    illum(0, 0) = 0.01;
    illum(0, 1) = -0.3;
    const Grid2D band(4, 5, 10.0);

    auto c_scheme = make_scheme("c");
    BandParameters cp;
    cp.c = 0.0;
    BandReport c_report;
    c_report.method = "c";
    const Grid2D c_out = c_scheme->apply(band, illum, kCosSz, cp, c_report);
    failures += expect_true(c_report.clamped_pixels == 2, "C-method clamps both low denominators");
    failures += expect_close(c_out(0, 0), 10.0 * kCosSz / 0.05, "clamped denominator uses the floor");
    failures += expect_true(std::isfinite(c_out(0, 1)), "shadowed pixel stays finite");
    failures += expect_true(c_report.warnings.size() == 1, "one singularity warning per band");

    auto m_scheme = make_scheme("minnaert");
    BandParameters mp;
    mp.k = 0.5;
    BandReport m_report;
    const Grid2D m_out = m_scheme->apply(band, illum, kCosSz, mp, m_report);
    failures += expect_true(m_report.clamped_pixels == 2, "Minnaert clamps both low cos gi");
    failures += expect_close(m_out(0, 1), 10.0 * std::sqrt(kCosSz / 0.05), "Minnaert shadowed pixel uses the floor");
    failures += expect_close(m_out(3, 4), 10.0 * std::sqrt(kCosSz / illum(3, 4)), "unclamped pixel untouched by the floor");
    return failures;
}

int test_nodata_pass_through()
{
    int failures = 0;
    const Grid2D illum = ramp_illumination();
    Grid2D band = linear_band(illum, 50.0, 20.0);
    band(1, 2) = -9999.0;
    band(2, 3) = std::nan("");

    CorrectionConfig cfg;
    cfg.has_nodata = true;
    cfg.nodata_value = -9999.0;

    for (const std::string method : {"c", "minnaert", "stat"})
    {
        auto scheme = make_scheme(method, cfg);
        const BandParameters params = scheme->fit(band, illum, kCosSz);
        failures += expect_true(params.sample_count == 18, method + ": nodata and NaN excluded from the fit");

        BandReport report;
        const Grid2D out = scheme->apply(band, illum, kCosSz, params, report);
        failures += expect_true(out(1, 2) == -9999.0, method + ": nodata pixel copied through");
        failures += expect_true(std::isnan(out(2, 3)), method + ": NaN pixel copied through");
        failures += expect_true(report.skipped_pixels == 2, method + ": skipped pixels counted");
    }

    auto c_scheme = make_scheme("c", cfg);
    failures += expect_close(c_scheme->fit(band, illum, kCosSz).c, 0.4, "C unaffected by nodata pixels", 1.0e-10);
    return failures;
}

int test_sample_stride()
{
    int failures = 0;
    const Grid2D illum = ramp_illumination();
    const Grid2D band = linear_band(illum, 50.0, 20.0);
    CorrectionConfig cfg;
    cfg.sample_stride = 2;
    auto scheme = make_scheme("c", cfg);
    const BandParameters params = scheme->fit(band, illum, kCosSz);
    // Rows 0, 2 and columns 0, 2, 4.
    failures += expect_true(params.sample_count == 6, "stride 2 samples every other row and column");
    failures += expect_close(params.c, 0.4, "strided fit still exact on linear data", 1.0e-10);
    return failures;
}

int test_config_validation()
{
    int failures = 0;
    auto rejects = [](const CorrectionConfig& cfg)
    {
        try
        {
            validate_correction_config(cfg);
        }
        catch (const InvalidConfigError&)
        {
            return true;
        }
        return false;
    };

    failures += expect_true(!rejects(CorrectionConfig{}), "defaults are valid");

    CorrectionConfig one_stratum;
    one_stratum.n_strat = 1;
    failures += expect_true(rejects(one_stratum), "n_strat = 1 is rejected");

    CorrectionConfig negative_strata;
    negative_strata.n_strat = -3;
    failures += expect_true(rejects(negative_strata), "negative n_strat is rejected");

    CorrectionConfig zero_floor;
    zero_floor.illumination_floor = 0.0;
    failures += expect_true(rejects(zero_floor), "zero illumination floor is rejected");

    CorrectionConfig zero_stride;
    zero_stride.sample_stride = 0;
    failures += expect_true(rejects(zero_stride), "zero stride is rejected");

    CorrectionConfig unknown;
    unknown.method_id = "dark_object";
    failures += expect_true(rejects(unknown), "unknown method is rejected");

    bool threw = false;
    try
    {
        (void)create_correction_scheme("sun_canopy_sensor");
    }
    catch (const InvalidConfigError&)
    {
        threw = true;
    }
    failures += expect_true(threw, "factory rejects unknown methods");

    failures += expect_true(normalize_correction_method_name(" C-Correction ") == "c", "method names are normalized");
    failures += expect_true(normalize_correction_method_name("SE") == "stat", "se alias maps to stat");
    failures += expect_true(get_available_correction_schemes().size() == 3, "three correction methods registered");

    DegeneratePolicy policy = DegeneratePolicy::identity;
    failures += expect_true(parse_degenerate_policy("Strict", policy) && policy == DegeneratePolicy::strict,
                            "strict policy parses");
    failures += expect_true(!parse_degenerate_policy("maybe", policy), "unknown policy rejected");
    return failures;
}

} // namespace

int main()
{
    tpc::global_log_profile = tpc::LogProfile::quiet;

    int failures = 0;
    failures += test_c_method_fit_and_apply();
    failures += test_c_method_large_c_is_identity();
    failures += test_minnaert_limits();
    failures += test_minnaert_fit_recovers_exponent();
    failures += test_stratification_order_independent();
    failures += test_statistical_exact_recovery();
    failures += test_degenerate_fallback_and_strict();
    failures += test_c_method_sign_flip_is_degenerate();
    failures += test_insufficient_data();
    failures += test_singularity_clamping();
    failures += test_nodata_pass_through();
    failures += test_sample_stride();
    failures += test_config_validation();

    if (failures > 0)
    {
        std::cerr << "[correction-regression] FAILED with " << failures << " check(s)." << std::endl;
        return 1;
    }

    std::cout << "[correction-regression] all checks passed" << std::endl;
    return 0;
}
