#pragma once

#include "vegetation_types.h"
#include "../seed/seed_stream.h"

#include <vector>

namespace vegetation {

    class VegetationSystem {
    public:
        // Half-saturation water availability in [0, 1)
        static float waterFactor(float water, float half);

        // Gaussian closeness to the temperature optimum in (0, 1]
        static float heatFactor(float temperature, float optimum, float sigma);

        // k * V * (1 - V/K) * suitability
        static float logisticGrowth(float v, float k, float capacity, float suitability);

        // The vegetation stream's only draws: a bounded noise raster in
        // [-noiseAmp, noiseAmp]. Independent of every other subsystem.
        static std::vector<float> noiseLayer(int width, int height, const VegetationProfile& profile,
                                             seed::SeedStream stream);

        // Tick-0 vegetation: K * waterFactor * heatFactor + noise, clipped to [lo, hi].
        // High only where both water and temperature are favourable.
        static std::vector<float> initialize(const std::vector<float>& hydration,
                                             const std::vector<float>& temperature,
                                             const std::vector<float>& noise,
                                             const VegetationProfile& profile,
                                             float lo, float hi);
    };

} // namespace vegetation
