#include "simulation.h"
#include "../storage/delta_encoder.h"
#include "../log.h"

namespace world {

namespace {

kernels::KernelSettings settingsFor(const core::ScenarioConfig& cfg) {
    kernels::KernelSettings s;
    s.boundary.wrapX = cfg.world.wrapX;
    s.boundary.wrapY = cfg.world.wrapY;
    s.diffusion = cfg.passes.diffusion;
    s.advection = cfg.passes.advection;
    s.coupling = cfg.passes.coupling;
    return s;
}

} // namespace

Simulation::Simulation(const core::ScenarioConfig& cfg)
    : cfg_(cfg),
      registry_(field::FieldRegistry::build(cfg.fields)),
      streams_(cfg.randomness.seed, cfg.randomness.streamSalts),
      initial_(InitialFieldGenerator::generate(cfg_, registry_, streams_)),
      engine_(registry_, settingsFor(cfg_), initial_.terrain.ridgeMask(),
              streams_.claim(seed::SeedStreamSet::NOISE)),
      state_(initial_.tensor) {
}

const grid::GridTensor& Simulation::step() {
    state_ = engine_.step(state_);
    ++tick_;
    return state_;
}

void runHeadless(const core::ScenarioConfig& cfg, uint64_t ticks, const std::filesystem::path& runDir,
                 const storage::StoreOptions& options, const TickObserver& observer) {
    Simulation sim(cfg);
    storage::RunArtifactStore store(runDir, cfg, sim.registry(), sim.state(), sim.initial().hydrology, options);
    if (observer) observer(0, sim.state());

    logMessage(LogLevel::Info, "[Simulation] Running %llu ticks (seed %llu)\n",
               static_cast<unsigned long long>(ticks), static_cast<unsigned long long>(cfg.randomness.seed));

    for (uint64_t t = 1; t <= ticks; ++t) {
        grid::GridTensor previous = sim.state();
        const grid::GridTensor& next = sim.step();
        store.append(storage::DeltaEncoder::encode(previous, next, sim.tick()), next);
        if (observer) observer(sim.tick(), next);

        if (t % 100 == 0) {
            logMessage(LogLevel::Debug, "[Simulation] Tick %llu/%llu\n",
                       static_cast<unsigned long long>(t), static_cast<unsigned long long>(ticks));
        }
    }

    store.seal();
}

} // namespace world
