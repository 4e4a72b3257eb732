#pragma once
#include "terrain_map.h"
#include "../math/noise.h"
#include "../seed/seed_stream.h"

namespace terrain {

/**
 * @brief Builds the static terrain from the hydrology seed stream.
 *
 * Owns the hydrology stream; nothing else draws from it. The noise lattice
 * consumes it at construction.
 */
class TerrainGenerator {
public:
    explicit TerrainGenerator(seed::SeedStream stream);

    // Main processing chain: elevation -> drainage -> depression fill -> water classes
    void generate(TerrainMap& map, const HydrologyProfile& profile, bool wrapX, bool wrapY);

    // Noise + ridge blend, smoothed over elevationScale / 6 cells
    void generateElevation(TerrainMap& map, const HydrologyProfile& profile, bool wrapX, bool wrapY);
    // D8 steepest descent + accumulation in high-to-low order
    void calculateDrainage(TerrainMap& map, bool wrapX, bool wrapY);
    // Priority flood from the border
    void fillDepressions(TerrainMap& map, bool wrapX, bool wrapY);
    // Ridges, rivers and lakes
    void classifyWater(TerrainMap& map, const HydrologyProfile& profile);

private:
    math::NoiseField noise_;
};

} // namespace terrain
