#pragma once

#include <vector>
#include "../core/scenario_config.h"
#include "../field/field_registry.h"
#include "../grid/grid_tensor.h"
#include "../seed/seed_stream.h"
#include "../terrain/terrain_map.h"
#include "../terrain/hydrology_report.h"

namespace world {

// Field names the generator owns. Any other field starts at its `initial` value.
constexpr const char* FIELD_TEMPERATURE = "temperature";
constexpr const char* FIELD_HYDRATION = "hydration";
constexpr const char* FIELD_VEGETATION = "vegetation";

struct InitialState {
    grid::GridTensor tensor;          // Tick 0
    terrain::TerrainMap terrain;      // Static, feeds the ridge term of derived fields
    terrain::HydrologyStats hydrology;

    // Raw generator layers (before clipping to field bounds)
    std::vector<float> hydration;
    std::vector<float> temperature;
    std::vector<float> vegetationNoise;
    std::vector<float> vegetation;
};

class InitialFieldGenerator {
public:
    // Range checks on generator profiles and field coefficients. Throws core::ConfigError.
    static void validate(const core::ScenarioConfig& cfg, const field::FieldRegistry& registry);

    // Claims the hydrology, temperature and vegetation streams from the set.
    static InitialState generate(const core::ScenarioConfig& cfg, const field::FieldRegistry& registry,
                                 seed::SeedStreamSet& streams);
};

} // namespace world
