/**
 * @file factory.hpp
 * @brief Declarations for the correction module.
 *
 * Scheme lookup for radiometric topographic correction methods.
 */

#pragma once
#include <memory>
#include <string>
#include "correction_base.hpp"

namespace tpc {

class CMethodScheme;
class MinnaertScheme;
class StatisticalScheme;

}
