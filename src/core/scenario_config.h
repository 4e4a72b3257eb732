#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

#include "../field/field_spec.h"
#include "../terrain/terrain_map.h"
#include "../climate/temperature_field.h"
#include "../vegetation/vegetation_types.h"

namespace core {

struct WorldConfig {
    int width = 64;
    int height = 64;
    bool wrapX = true;
    bool wrapY = true;
};

struct RandomnessConfig {
    uint64_t seed = 42;
    // Optional per-subsystem salt; perturbs exactly one stream.
    std::map<std::string, uint64_t> streamSalts;
};

// Optional kernel passes. Clip and derived recomputation always run.
struct PassConfig {
    bool diffusion = true;
    bool advection = true;
    bool coupling = true;
};

struct OutputConfig {
    int checkpointInterval = 100; // K
    int metricsCadence = 1;       // Metrics rows every N ticks
};

/**
 * @brief Resolved scenario: everything a run needs, with defaults applied.
 */
struct ScenarioConfig {
    std::string name = "default";
    WorldConfig world;
    RandomnessConfig randomness;
    std::vector<field::FieldSpec> fields;
    terrain::HydrologyProfile hydrology;
    climate::HeatProfile heat;
    vegetation::VegetationProfile vegetation;
    PassConfig passes;
    OutputConfig outputs;
};

// Canonical pass order; a scenario's pass list must be a subsequence of it.
const std::vector<std::string>& canonicalPassOrder();

// 64x64, seed 42, temperature / hydration / vegetation / movement_cost.
ScenarioConfig defaultScenario();

// Missing keys fall back to defaultScenario(). Throws ConfigError.
ScenarioConfig scenarioFromJson(const nlohmann::json& j);
nlohmann::json scenarioToJson(const ScenarioConfig& cfg);

ScenarioConfig loadScenario(const std::string& path);
void saveScenario(const ScenarioConfig& cfg, const std::string& path);

// FNV-1a 64 over the compact, key-sorted JSON form.
uint64_t scenarioHash(const ScenarioConfig& cfg);

} // namespace core
