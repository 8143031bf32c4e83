#pragma once

#include <stdexcept>
#include <string>

/**
 * @file errors.hpp
 * @brief Exception taxonomy for the topographic correction library.
 *
 * Input-validation failures abort the whole operation and never return a
 * partial grid. Per-pixel singularities are not exceptions; they are
 * clamped locally and counted in the band report.
 */

namespace tpc
{

class TopoCorrectionError : public std::runtime_error
{
public:
    explicit TopoCorrectionError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Mismatched dimensions, non-positive cell spacing, or grids below 2x2.
 */
class InvalidGridError : public TopoCorrectionError
{
public:
    explicit InvalidGridError(const std::string& what) : TopoCorrectionError(what) {}
};

/**
 * @brief Regression cannot be fit (fewer than two distinct illumination values).
 */
class InsufficientDataError : public TopoCorrectionError
{
public:
    explicit InsufficientDataError(const std::string& what) : TopoCorrectionError(what) {}
};

/**
 * @brief Fitted slope or exponent outside its physically meaningful range.
 *
 * Raised only under the strict degenerate policy; the default policy falls
 * back to the identity correction.
 */
class DegenerateParameterError : public TopoCorrectionError
{
public:
    explicit DegenerateParameterError(const std::string& what) : TopoCorrectionError(what) {}
};

/**
 * @brief Unusable configuration (unknown method, bad strata count, sun below horizon).
 */
class InvalidConfigError : public TopoCorrectionError
{
public:
    explicit InvalidConfigError(const std::string& what) : TopoCorrectionError(what) {}
};

} // namespace tpc
