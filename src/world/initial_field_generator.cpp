#include "initial_field_generator.h"
#include "../core/errors.h"
#include "../climate/temperature_field.h"
#include "../kernels/derived_fields.h"
#include "../landscape/hydro_system.h"
#include "../terrain/terrain_generator.h"
#include "../vegetation/vegetation_system.h"
#include "../log.h"
#include <algorithm>
#include <cmath>

namespace world {

namespace {

void require(bool ok, const std::string& message) {
    if (!ok) throw core::ConfigError(message);
}

void writeLayer(grid::GridTensor& tensor, const field::FieldSpec& spec, const std::vector<float>& layer) {
    std::vector<float> clipped(layer.size());
    for (size_t k = 0; k < layer.size(); ++k) {
        clipped[k] = std::isnan(layer[k]) ? spec.lo : std::clamp(layer[k], spec.lo, spec.hi);
    }
    tensor.setFieldSlice(spec.index, clipped);
}

} // namespace

void InitialFieldGenerator::validate(const core::ScenarioConfig& cfg, const field::FieldRegistry& registry) {
    field::validateCoefficientRanges(registry);

    const terrain::HydrologyProfile& hp = cfg.hydrology;
    require(hp.elevationScale > 0.0f, "hydrology: elevation_scale must be > 0");
    require(hp.octaves >= 1 && hp.octaves <= 16, "hydrology: octaves must be in [1, 16]");
    require(hp.persistence > 0.0f && hp.persistence <= 1.0f, "hydrology: persistence must be in (0, 1]");
    require(hp.ridgeStrength >= 0.0f && hp.ridgeStrength <= 1.0f, "hydrology: ridge_strength must be in [0, 1]");
    require(hp.ridgeThreshold >= 0.0f && hp.ridgeThreshold <= 1.0f, "hydrology: ridge_threshold must be in [0, 1]");
    require(hp.riverPercentile > 0.0f && hp.riverPercentile < 1.0f, "hydrology: river_percentile must be in (0, 1)");
    require(hp.lakeFillThreshold >= 0.0f && hp.lakeFillThreshold <= 1.0f,
            "hydrology: lake_fill_threshold must be in [0, 1]");
    require(hp.lakeMinDepth >= 0.0f, "hydrology: lake_min_depth must be >= 0");
    require(hp.riverDecay > 0.0f && hp.lakeDecay > 0.0f, "hydrology: decay distances must be > 0");
    require(hp.smoothingSigma >= 0.0f, "hydrology: smoothing_sigma must be >= 0");

    const climate::HeatProfile& heat = cfg.heat;
    require(heat.amplitude >= 0.0f && heat.amplitude <= 1.0f, "heat: amplitude must be in [0, 1]");
    require(heat.noiseAmp >= 0.0f, "heat: noise_amp must be >= 0");
    require(heat.noiseScale > 0.0f, "heat: noise_scale must be > 0");

    const vegetation::VegetationProfile& vp = cfg.vegetation;
    require(vp.k >= 0.0f, "vegetation: k must be >= 0");
    require(vp.waterHalf > 0.0f, "vegetation: water_half must be > 0");
    require(vp.heatSigma > 0.0f, "vegetation: heat_sigma must be > 0");
    require(vp.carryingCapacity > 0.0f, "vegetation: carrying_capacity must be > 0");
    require(vp.noiseAmp >= 0.0f, "vegetation: noise_amp must be >= 0");
    require(vp.noiseScale > 0.0f, "vegetation: noise_scale must be > 0");
}

InitialState InitialFieldGenerator::generate(const core::ScenarioConfig& cfg, const field::FieldRegistry& registry,
                                             seed::SeedStreamSet& streams) {
    validate(cfg, registry);

    const int w = cfg.world.width;
    const int h = cfg.world.height;
    const bool wrapX = cfg.world.wrapX;
    const bool wrapY = cfg.world.wrapY;

    InitialState state;
    state.terrain.resize(w, h);

    // Each subsystem sees only its own stream
    terrain::TerrainGenerator terrainGen(streams.claim(seed::SeedStreamSet::HYDROLOGY));
    terrainGen.generate(state.terrain, cfg.hydrology, wrapX, wrapY);
    state.hydrology = terrain::HydrologyReport::analyze(state.terrain);
    logMessage(LogLevel::Info, "[InitialFields] %s\n", terrain::HydrologyReport::format(state.hydrology).c_str());

    state.hydration = landscape::HydroSystem::computeHydration(state.terrain, cfg.hydrology, wrapX, wrapY);
    state.temperature = climate::TemperatureField::generate(w, h, cfg.heat,
                                                            streams.claim(seed::SeedStreamSet::TEMPERATURE));
    state.vegetationNoise = vegetation::VegetationSystem::noiseLayer(w, h, cfg.vegetation,
                                                                     streams.claim(seed::SeedStreamSet::VEGETATION));

    // Vegetation always reads the generated water and heat, even if the bounds
    // of a declared hydration/temperature field are narrower.
    float vegLo = 0.0f;
    float vegHi = 1.0f;
    int vegIndex = registry.indexOf(FIELD_VEGETATION);
    if (vegIndex >= 0) {
        vegLo = registry.at(vegIndex).lo;
        vegHi = registry.at(vegIndex).hi;
    }
    state.vegetation = vegetation::VegetationSystem::initialize(state.hydration, state.temperature,
                                                                state.vegetationNoise, cfg.vegetation,
                                                                vegLo, vegHi);

    state.tensor = grid::GridTensor(h, w, registry.size());
    for (const auto& spec : registry.specs()) {
        if (spec.derived) continue;
        if (spec.name == FIELD_TEMPERATURE) {
            writeLayer(state.tensor, spec, state.temperature);
        } else if (spec.name == FIELD_HYDRATION) {
            writeLayer(state.tensor, spec, state.hydration);
        } else if (spec.name == FIELD_VEGETATION) {
            writeLayer(state.tensor, spec, state.vegetation);
        } else {
            std::vector<float> layer(state.tensor.cellCount(), spec.initial);
            writeLayer(state.tensor, spec, layer);
        }
    }

    kernels::DerivedFields::recompute(state.tensor, registry, state.terrain.ridgeMask());

    logMessage(LogLevel::Info, "[InitialFields] Tick 0 ready: %dx%d, %d fields\n", h, w, registry.size());
    return state;
}

} // namespace world
