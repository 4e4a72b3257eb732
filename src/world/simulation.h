#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include "initial_field_generator.h"
#include "../core/scenario_config.h"
#include "../field/field_registry.h"
#include "../grid/grid_tensor.h"
#include "../kernels/kernel_engine.h"
#include "../seed/seed_stream.h"
#include "../storage/run_artifact_store.h"

namespace world {

/**
 * @brief One live run: registry, seed streams, static terrain and the
 * current tensor. Strictly sequential; every tick needs the full previous one.
 */
class Simulation {
public:
    // Throws core::ConfigError for an inconsistent scenario.
    explicit Simulation(const core::ScenarioConfig& cfg);

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;

    // Advances one tick and returns the new state.
    const grid::GridTensor& step();

    uint64_t tick() const { return tick_; }
    const grid::GridTensor& state() const { return state_; }

    const core::ScenarioConfig& config() const { return cfg_; }
    const field::FieldRegistry& registry() const { return registry_; }
    const InitialState& initial() const { return initial_; }

private:
    core::ScenarioConfig cfg_;
    field::FieldRegistry registry_;
    seed::SeedStreamSet streams_;
    InitialState initial_;
    kernels::KernelEngine engine_;
    grid::GridTensor state_;
    uint64_t tick_ = 0;
};

// Sees tick 0 and then every live tensor, after it has been persisted.
using TickObserver = std::function<void(uint64_t tick, const grid::GridTensor& tensor)>;

// Simulates `ticks` ticks into runDir and seals it.
void runHeadless(const core::ScenarioConfig& cfg, uint64_t ticks, const std::filesystem::path& runDir,
                 const storage::StoreOptions& options = {}, const TickObserver& observer = nullptr);

} // namespace world
