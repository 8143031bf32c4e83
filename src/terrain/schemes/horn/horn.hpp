/**
 * @file horn.hpp
 * @brief Declarations for the terrain module.
 *
 * Horn (1981) 3x3 weighted finite-difference gradient scheme.
 */

#pragma once
#include "terrain/base/gradient.hpp"

namespace tpc {

/**
 * @brief Horn 3x3 gradient scheme, the default for slope/aspect extraction.
 */
class HornScheme : public TerrainSchemeBase
{
private:
    TerrainConfig config_;

public:
    HornScheme();

    std::string name() const override { return "horn"; }

    /**
     * @brief Stores spacing and elevation scaling for later gradient calls.
     */
    void initialize(const TerrainConfig& cfg) override;

    /**
     * @brief Evaluates the 1-2-1 weighted gradient around one cell.
     */
    void gradient_at(const Grid2D& elevation, int r, int c,
                     double& dzdx, double& dzdy) const override;
};

}
