#include <iostream>
#include <cassert>
#include <cmath>
#include <vector>
#include "../src/seed/seed_stream.h"
#include "../src/vegetation/vegetation_types.h"
#include "../src/vegetation/vegetation_system.h"

using namespace vegetation;

void test_water_factor() {
    std::cout << "Running test_water_factor..." << std::endl;
    assert(VegetationSystem::waterFactor(0.0f, 0.35f) == 0.0f);
    // Half saturation at water == half
    assert(std::abs(VegetationSystem::waterFactor(0.35f, 0.35f) - 0.5f) < 1e-5f);
    assert(VegetationSystem::waterFactor(0.9f, 0.35f) > VegetationSystem::waterFactor(0.5f, 0.35f));
    assert(VegetationSystem::waterFactor(1.0f, 0.35f) < 1.0f);
    std::cout << "PASSED" << std::endl;
}

void test_heat_factor() {
    std::cout << "Running test_heat_factor..." << std::endl;
    assert(std::abs(VegetationSystem::heatFactor(0.65f, 0.65f, 0.18f) - 1.0f) < 1e-6f);
    // Symmetric around the optimum
    float below = VegetationSystem::heatFactor(0.45f, 0.65f, 0.18f);
    float above = VegetationSystem::heatFactor(0.85f, 0.65f, 0.18f);
    assert(std::abs(below - above) < 1e-5f);
    assert(below < 1.0f && below > 0.0f);
    std::cout << "PASSED" << std::endl;
}

void test_logistic_growth() {
    std::cout << "Running test_logistic_growth..." << std::endl;
    assert(VegetationSystem::logisticGrowth(0.0f, 0.08f, 1.0f, 1.0f) == 0.0f);
    assert(std::abs(VegetationSystem::logisticGrowth(1.0f, 0.08f, 1.0f, 1.0f)) < 1e-6f);
    float mid = VegetationSystem::logisticGrowth(0.5f, 0.08f, 1.0f, 1.0f);
    assert(std::abs(mid - 0.02f) < 1e-5f);
    // Suitability scales growth
    assert(VegetationSystem::logisticGrowth(0.5f, 0.08f, 1.0f, 0.5f) < mid);
    std::cout << "PASSED" << std::endl;
}

void test_noise_layer_bounds() {
    std::cout << "Running test_noise_layer_bounds..." << std::endl;
    VegetationProfile profile;
    profile.noiseAmp = 0.02f;
    std::vector<float> layer = VegetationSystem::noiseLayer(32, 16, profile, seed::derive(42, "vegetation"));
    assert(layer.size() == 32u * 16u);
    bool varied = false;
    for (float v : layer) {
        assert(v >= -profile.noiseAmp && v <= profile.noiseAmp);
        if (v != layer[0]) varied = true;
    }
    assert(varied);

    std::vector<float> again = VegetationSystem::noiseLayer(32, 16, profile, seed::derive(42, "vegetation"));
    assert(layer == again);
    std::cout << "PASSED" << std::endl;
}

void test_initialize_needs_water_and_heat() {
    std::cout << "Running test_initialize_needs_water_and_heat..." << std::endl;
    VegetationProfile profile;
    // wet+optimal, dry+optimal, wet+cold
    std::vector<float> hydration = {0.9f, 0.0f, 0.9f};
    std::vector<float> temperature = {0.65f, 0.65f, 0.0f};
    std::vector<float> noise = {0.0f, 0.0f, 0.0f};

    std::vector<float> veg = VegetationSystem::initialize(hydration, temperature, noise, profile, 0.0f, 1.0f);
    assert(veg[0] > 0.5f);
    assert(veg[1] == 0.0f);
    assert(veg[2] < 0.01f);

    // Noise cannot push below the lower bound
    noise = {0.0f, -0.5f, 0.0f};
    veg = VegetationSystem::initialize(hydration, temperature, noise, profile, 0.0f, 1.0f);
    assert(veg[1] == 0.0f);
    std::cout << "PASSED" << std::endl;
}

int main() {
    test_water_factor();
    test_heat_factor();
    test_logistic_growth();
    test_noise_layer_bounds();
    test_initialize_needs_water_and_heat();
    std::cout << "ALL TESTS PASSED" << std::endl;
    return 0;
}
