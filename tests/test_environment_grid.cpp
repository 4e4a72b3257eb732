#include <iostream>
#include <cassert>
#include <filesystem>
#include <string>
#include <vector>
#include "../src/core/errors.h"
#include "../src/core/scenario_config.h"
#include "../src/storage/hydrator.h"
#include "../src/world/environment_grid.h"
#include "../src/world/simulation.h"

namespace fs = std::filesystem;

template <typename E, typename Fn>
bool throwsType(Fn fn) {
    try {
        fn();
    } catch (const E&) {
        return true;
    }
    return false;
}

struct RecordedRun {
    fs::path dir;
    std::vector<grid::GridTensor> live;
};

static RecordedRun record(uint64_t ticks) {
    RecordedRun run;
    run.dir = fs::temp_directory_path() / "envgrid_test_environment_grid";
    fs::remove_all(run.dir);

    core::ScenarioConfig cfg = core::defaultScenario();
    cfg.world.width = 20;
    cfg.world.height = 12;
    cfg.outputs.checkpointInterval = 5;
    world::runHeadless(cfg, ticks, run.dir, {}, [&run](uint64_t, const grid::GridTensor& t) {
        run.live.push_back(t);
    });
    return run;
}

void test_reads_require_load(const storage::Hydrator& hydrator) {
    std::cout << "Running test_reads_require_load..." << std::endl;
    world::EnvironmentGrid env(hydrator);
    assert(!env.loaded());
    assert(throwsType<core::StateError>([&]() { env.loadedTick(); }));
    assert(throwsType<core::StateError>([&]() { env.fieldSlice("hydration"); }));
    assert(throwsType<core::StateError>([&]() { env.cell(0, 0, "hydration"); }));
    assert(throwsType<core::StateError>([&]() { env.allFieldsAt(0, 0); }));
    assert(throwsType<core::StateError>([&]() { env.neighborhood(0, 0); }));

    // Shape and names come from the run, not the loaded tick
    world::GridShape shape = env.shape();
    assert(shape.height == 12 && shape.width == 20 && shape.fields == 4);
    assert(env.fieldNames()[0] == "temperature");
    std::cout << "PASSED" << std::endl;
}

void test_cell_queries(const storage::Hydrator& hydrator, const std::vector<grid::GridTensor>& live) {
    std::cout << "Running test_cell_queries..." << std::endl;
    world::EnvironmentGrid env(hydrator);
    env.loadTick(7);
    assert(env.loaded() && env.loadedTick() == 7);

    const int hydration = hydrator.fieldIndex("hydration");
    assert(env.cell(3, 11, "hydration") == live[7].at(3, 11, hydration));

    std::vector<float> slice = env.fieldSlice("vegetation");
    assert(slice.size() == 12 * 20);
    assert(slice[static_cast<size_t>(4 * 20 + 9)] == live[7].at(4, 9, hydrator.fieldIndex("vegetation")));

    std::map<std::string, float> all = env.allFieldsAt(11, 19);
    assert(all.size() == 4);
    for (const auto& name : hydrator.fieldNames()) {
        assert(all.at(name) == live[7].at(11, 19, hydrator.fieldIndex(name)));
    }
    std::cout << "PASSED" << std::endl;
}

void test_neighborhood_clipping(const storage::Hydrator& hydrator, const std::vector<grid::GridTensor>& live) {
    std::cout << "Running test_neighborhood_clipping..." << std::endl;
    world::EnvironmentGrid env(hydrator);
    env.loadTick(3);

    world::Neighborhood corner = env.neighborhood(0, 0, 1);
    assert(corner.rowMin == 0 && corner.colMin == 0);
    assert(corner.rows == 2 && corner.cols == 2);
    assert(corner.layers.size() == 4);
    assert(corner.layers.at("temperature").size() == 4);

    world::Neighborhood middle = env.neighborhood(6, 10, 2);
    assert(middle.rowMin == 4 && middle.colMin == 8);
    assert(middle.rows == 5 && middle.cols == 5);
    const int t = hydrator.fieldIndex("temperature");
    // Row-major inside the window
    assert(middle.layers.at("temperature")[static_cast<size_t>(1 * 5 + 3)] == live[3].at(5, 11, t));

    world::Neighborhood single = env.neighborhood(11, 19, 0);
    assert(single.rows == 1 && single.cols == 1);

    world::Neighborhood everything = env.neighborhood(5, 5, 1000000);
    assert(everything.rows == 12 && everything.cols == 20);
    std::cout << "PASSED" << std::endl;
}

void test_invalid_queries(const storage::Hydrator& hydrator) {
    std::cout << "Running test_invalid_queries..." << std::endl;
    world::EnvironmentGrid env(hydrator);
    env.loadTick(0);

    assert(throwsType<core::NotFoundError>([&]() { env.fieldSlice("salinity"); }));
    assert(throwsType<core::NotFoundError>([&]() { env.cell(0, 0, "salinity"); }));
    assert(throwsType<core::NotFoundError>([&]() { env.cell(12, 0, "hydration"); }));
    assert(throwsType<core::NotFoundError>([&]() { env.cell(0, -1, "hydration"); }));
    assert(throwsType<core::NotFoundError>([&]() { env.allFieldsAt(0, 20); }));
    assert(throwsType<core::NotFoundError>([&]() { env.neighborhood(-1, 0); }));
    assert(throwsType<core::NotFoundError>([&]() { env.neighborhood(0, 0, -1); }));
    std::cout << "PASSED" << std::endl;
}

void test_failed_load_keeps_previous_tick(const storage::Hydrator& hydrator, const std::vector<grid::GridTensor>& live) {
    std::cout << "Running test_failed_load_keeps_previous_tick..." << std::endl;
    world::EnvironmentGrid env(hydrator);
    env.loadTick(4);
    assert(throwsType<core::NotFoundError>([&]() { env.loadTick(hydrator.lastTick() + 1); }));
    assert(env.loadedTick() == 4);
    const int v = hydrator.fieldIndex("vegetation");
    assert(env.cell(2, 2, "vegetation") == live[4].at(2, 2, v));

    env.loadTick(hydrator.lastTick());
    assert(env.loadedTick() == hydrator.lastTick());
    std::cout << "PASSED" << std::endl;
}

int main() {
    RecordedRun run = record(12);
    {
        storage::Hydrator hydrator(run.dir);
        test_reads_require_load(hydrator);
        test_cell_queries(hydrator, run.live);
        test_neighborhood_clipping(hydrator, run.live);
        test_invalid_queries(hydrator);
        test_failed_load_keeps_previous_tick(hydrator, run.live);
    }
    fs::remove_all(run.dir);
    std::cout << "ALL TESTS PASSED" << std::endl;
    return 0;
}
