/**
 * @file central.hpp
 * @brief Declarations for the terrain module.
 *
 * Two-point central difference over the 4-neighbourhood.
 */

#pragma once
#include "terrain/base/gradient.hpp"

namespace tpc {

class CentralDifferenceScheme : public TerrainSchemeBase
{
private:
    TerrainConfig config_;

public:
    CentralDifferenceScheme();

    std::string name() const override { return "central"; }

    void initialize(const TerrainConfig& cfg) override;

    void gradient_at(const Grid2D& elevation, int r, int c,
                     double& dzdx, double& dzdy) const override;
};

}
