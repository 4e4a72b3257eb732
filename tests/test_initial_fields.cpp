#include <iostream>
#include <cassert>
#include <cmath>
#include "../src/core/errors.h"
#include "../src/core/scenario_config.h"
#include "../src/field/field_registry.h"
#include "../src/kernels/derived_fields.h"
#include "../src/seed/seed_stream.h"
#include "../src/world/initial_field_generator.h"

using namespace world;

template <typename E, typename Fn>
static bool throwsType(Fn fn) {
    try {
        fn();
    } catch (const E&) {
        return true;
    }
    return false;
}

static InitialState generateFor(const core::ScenarioConfig& cfg) {
    field::FieldRegistry reg = field::FieldRegistry::build(cfg.fields);
    seed::SeedStreamSet streams(cfg.randomness.seed, cfg.randomness.streamSalts);
    return InitialFieldGenerator::generate(cfg, reg, streams);
}

static double rowMean(const grid::GridTensor& t, int row, int field) {
    double sum = 0.0;
    for (int c = 0; c < t.width(); ++c) sum += t.at(row, c, field);
    return sum / t.width();
}

void test_north_hot_gradient() {
    std::cout << "Running test_north_hot_gradient..." << std::endl;
    core::ScenarioConfig cfg = core::defaultScenario();   // 64x64, seed 42, north, amplitude 0.6
    InitialState s = generateFor(cfg);
    const int t = 0;
    const int last = s.tensor.height() - 1;

    double north = rowMean(s.tensor, 0, t);
    double south = rowMean(s.tensor, last, t);
    assert(north - south > 0.5 * cfg.heat.amplitude);

    // Symmetric about the vertical midline within the noise band
    const float tolerance = 2.0f * cfg.heat.noiseAmp + 1e-6f;
    for (int r = 0; r <= last; ++r) {
        for (int c = 0; c < s.tensor.width() / 2; ++c) {
            float left = s.tensor.at(r, c, t);
            float right = s.tensor.at(r, s.tensor.width() - 1 - c, t);
            assert(std::fabs(left - right) <= tolerance);
        }
    }
    std::cout << "PASSED: north " << north << " south " << south << std::endl;
}

void test_south_and_equator() {
    std::cout << "Running test_south_and_equator..." << std::endl;
    core::ScenarioConfig cfg = core::defaultScenario();
    cfg.heat.direction = climate::HotEdge::South;
    InitialState s = generateFor(cfg);
    int last = s.tensor.height() - 1;
    assert(rowMean(s.tensor, last, 0) - rowMean(s.tensor, 0, 0) > 0.3);

    cfg.heat.direction = climate::HotEdge::Equator;
    InitialState e = generateFor(cfg);
    double mid = rowMean(e.tensor, last / 2, 0);
    assert(mid > rowMean(e.tensor, 0, 0) + 0.3);
    assert(mid > rowMean(e.tensor, last, 0) + 0.3);
    std::cout << "PASSED" << std::endl;
}

void test_bounds_and_finiteness() {
    std::cout << "Running test_bounds_and_finiteness..." << std::endl;
    core::ScenarioConfig cfg = core::defaultScenario();
    field::FieldRegistry reg = field::FieldRegistry::build(cfg.fields);
    InitialState s = generateFor(cfg);

    assert(s.tensor.allFinite());
    for (const auto& spec : reg.specs()) {
        for (size_t cell = 0; cell < s.tensor.cellCount(); ++cell) {
            float v = s.tensor.atCell(cell, spec.index);
            assert(v >= spec.lo && v <= spec.hi);
        }
    }
    std::cout << "PASSED" << std::endl;
}

void test_hydrology_structure() {
    std::cout << "Running test_hydrology_structure..." << std::endl;
    InitialState s = generateFor(core::defaultScenario());
    assert(s.hydrology.riverCells > 0);
    assert(s.hydrology.lakeCells > 0);
    assert(s.hydrology.riverFraction < 0.25f);

    // Wetter on rivers than on the driest land
    const auto& rivers = s.terrain.riverMask();
    double onRiver = 0.0, offRiver = 0.0;
    int nOn = 0, nOff = 0;
    for (size_t i = 0; i < rivers.size(); ++i) {
        if (rivers[i]) { onRiver += s.hydration[i]; nOn++; }
        else { offRiver += s.hydration[i]; nOff++; }
    }
    assert(onRiver / nOn > offRiver / nOff);

    // Ridges are a minority of cells
    assert(s.hydrology.ridgeCells > 0);
    assert(s.hydrology.ridgeCells < static_cast<int>(rivers.size()) / 2);

    // The tick-0 hydration layer varies across the grid
    const int hyd = field::FieldRegistry::build(core::defaultScenario().fields).indexOf(FIELD_HYDRATION);
    assert(hyd >= 0);
    double sum = 0.0, sumSq = 0.0;
    int saturated = 0;
    for (size_t cell = 0; cell < s.tensor.cellCount(); ++cell) {
        double v = s.tensor.atCell(cell, hyd);
        sum += v;
        sumSq += v * v;
        if (v >= 1.0) saturated++;
    }
    const double n = static_cast<double>(s.tensor.cellCount());
    const double mean = sum / n;
    const double variance = sumSq / n - mean * mean;
    assert(variance > 1e-3);
    assert(saturated < static_cast<int>(s.tensor.cellCount()));
    std::cout << "PASSED: hydration mean " << mean << " variance " << variance << std::endl;
}

void test_generation_is_deterministic() {
    std::cout << "Running test_generation_is_deterministic..." << std::endl;
    InitialState a = generateFor(core::defaultScenario());
    InitialState b = generateFor(core::defaultScenario());
    assert(a.tensor.bitIdentical(b.tensor));

    core::ScenarioConfig other = core::defaultScenario();
    other.randomness.seed = 43;
    InitialState c = generateFor(other);
    assert(!a.tensor.bitIdentical(c.tensor));
    std::cout << "PASSED" << std::endl;
}

void test_seed_independence() {
    std::cout << "Running test_seed_independence..." << std::endl;
    core::ScenarioConfig cfg = core::defaultScenario();
    core::ScenarioConfig perturbed = core::defaultScenario();
    perturbed.randomness.streamSalts[seed::SeedStreamSet::HYDROLOGY] = 0x9e3779b97f4a7c15ull;

    InitialState a = generateFor(cfg);
    InitialState b = generateFor(perturbed);

    // Terrain moved
    assert(a.terrain.elevation() != b.terrain.elevation());
    assert(a.hydration != b.hydration);

    // Temperature and the vegetation stream's own draws did not
    field::FieldRegistry reg = field::FieldRegistry::build(cfg.fields);
    int t = reg.require("temperature");
    assert(a.tensor.fieldSlice(t) == b.tensor.fieldSlice(t));
    assert(a.temperature == b.temperature);
    assert(a.vegetationNoise == b.vegetationNoise);
    std::cout << "PASSED" << std::endl;
}

void test_vegetation_follows_water_and_heat() {
    std::cout << "Running test_vegetation_follows_water_and_heat..." << std::endl;
    core::ScenarioConfig cfg = core::defaultScenario();
    InitialState s = generateFor(cfg);
    const auto& vp = cfg.vegetation;

    for (size_t i = 0; i < s.vegetation.size(); ++i) {
        float sw = s.hydration[i] / (s.hydration[i] + vp.waterHalf + 1e-8f);
        float z = (s.temperature[i] - vp.heatOptimum) / (vp.heatSigma + 1e-8f);
        float st = std::exp(-0.5f * z * z);
        // Never above what water and heat allow (plus the noise band)
        assert(s.vegetation[i] <= vp.carryingCapacity * sw * st + vp.noiseAmp + 1e-5f);
    }
    std::cout << "PASSED" << std::endl;
}

void test_derived_at_tick_zero() {
    std::cout << "Running test_derived_at_tick_zero..." << std::endl;
    core::ScenarioConfig cfg = core::defaultScenario();
    field::FieldRegistry reg = field::FieldRegistry::build(cfg.fields);
    InitialState s = generateFor(cfg);
    const field::FieldSpec& cost = reg.at(reg.require("movement_cost"));
    const auto& ridges = s.terrain.ridgeMask();

    for (size_t cell = 0; cell < s.tensor.cellCount(); ++cell) {
        float expected = kernels::DerivedFields::evaluate(cost, s.tensor, cell, ridges[cell] ? 1.0f : 0.0f);
        assert(s.tensor.atCell(cell, cost.index) == expected);
        float hyd = s.tensor.atCell(cell, reg.require("hydration"));
        float veg = s.tensor.atCell(cell, reg.require("vegetation"));
        assert(std::fabs(expected - (0.3f + 0.5f * veg + 0.2f * (1.0f - hyd))) < 1e-5f);
    }
    std::cout << "PASSED" << std::endl;
}

void test_unowned_fields_use_initial_value() {
    std::cout << "Running test_unowned_fields_use_initial_value..." << std::endl;
    core::ScenarioConfig cfg = core::defaultScenario();
    field::FieldSpec salinity;
    salinity.name = "salinity";
    salinity.initial = 0.25f;
    cfg.fields.push_back(salinity);
    field::FieldRegistry reg = field::FieldRegistry::build(cfg.fields);
    InitialState s = generateFor(cfg);
    int idx = reg.require("salinity");
    for (size_t cell = 0; cell < s.tensor.cellCount(); ++cell) {
        assert(s.tensor.atCell(cell, idx) == 0.25f);
    }
    std::cout << "PASSED" << std::endl;
}

void test_rejects_bad_profiles() {
    std::cout << "Running test_rejects_bad_profiles..." << std::endl;
    core::ScenarioConfig sigma = core::defaultScenario();
    sigma.vegetation.heatSigma = 0.0f;
    assert(throwsType<core::ConfigError>([&] { generateFor(sigma); }));

    core::ScenarioConfig diffusion = core::defaultScenario();
    diffusion.fields[0].diffusion = -0.05f;
    assert(throwsType<core::ConfigError>([&] { generateFor(diffusion); }));

    core::ScenarioConfig percentile = core::defaultScenario();
    percentile.hydrology.riverPercentile = 1.5f;
    assert(throwsType<core::ConfigError>([&] { generateFor(percentile); }));
    std::cout << "PASSED" << std::endl;
}

int main() {
    test_north_hot_gradient();
    test_south_and_equator();
    test_bounds_and_finiteness();
    test_hydrology_structure();
    test_generation_is_deterministic();
    test_seed_independence();
    test_vegetation_follows_water_and_heat();
    test_derived_at_tick_zero();
    test_unowned_fields_use_initial_value();
    test_rejects_bad_profiles();
    std::cout << "ALL TESTS PASSED" << std::endl;
    return 0;
}
