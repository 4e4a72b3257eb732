#pragma once

#include <vector>
#include "../terrain/terrain_map.h"

namespace landscape {

    class HydroSystem {
    public:
        // Tick-0 hydration from the static hydrology: falls off with distance
        // to rivers and lakes, rises in lowlands, smoothed, clipped to [0, 1].
        static std::vector<float> computeHydration(const terrain::TerrainMap& terrain,
                                                   const terrain::HydrologyProfile& profile,
                                                   bool wrapX, bool wrapY);
    };

} // namespace landscape
