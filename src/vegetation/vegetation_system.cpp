#include "vegetation_system.h"
#include "../math/noise.h"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace vegetation {

float VegetationSystem::waterFactor(float water, float half) {
    return water / (water + half + 1e-8f);
}

float VegetationSystem::heatFactor(float temperature, float optimum, float sigma) {
    float z = (temperature - optimum) / (sigma + 1e-8f);
    return std::exp(-0.5f * z * z);
}

float VegetationSystem::logisticGrowth(float v, float k, float capacity, float suitability) {
    return k * v * (1.0f - v / (capacity + 1e-8f)) * suitability;
}

std::vector<float> VegetationSystem::noiseLayer(int width, int height, const VegetationProfile& profile,
                                                seed::SeedStream stream) {
    math::NoiseField noise(stream);
    std::vector<float> layer = noise.raster(width, height, profile.noiseScale, 2, 0.5f, true);
    for (auto& v : layer) v *= profile.noiseAmp;
    return layer;
}

std::vector<float> VegetationSystem::initialize(const std::vector<float>& hydration,
                                                const std::vector<float>& temperature,
                                                const std::vector<float>& noise,
                                                const VegetationProfile& profile,
                                                float lo, float hi) {
    if (hydration.size() != temperature.size() || noise.size() != hydration.size()) {
        throw std::invalid_argument("vegetation inputs must share one grid");
    }

    std::vector<float> veg(hydration.size());
    const int size = static_cast<int>(veg.size());

    #pragma omp parallel for
    for (int i = 0; i < size; ++i) {
        const size_t k = static_cast<size_t>(i);
        float sw = waterFactor(hydration[k], profile.waterHalf);
        float st = heatFactor(temperature[k], profile.heatOptimum, profile.heatSigma);
        float v0 = profile.carryingCapacity * sw * st;
        veg[k] = std::clamp(v0 + noise[k], lo, hi);
    }
    return veg;
}

} // namespace vegetation
