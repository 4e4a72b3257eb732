#include <iostream>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include "../src/core/errors.h"
#include "../src/core/scenario_config.h"

using namespace core;
using json = nlohmann::json;

template <typename E, typename Fn>
static bool throwsType(Fn fn) {
    try {
        fn();
    } catch (const E&) {
        return true;
    }
    return false;
}

void test_defaults() {
    std::cout << "Running test_defaults..." << std::endl;
    ScenarioConfig cfg = defaultScenario();
    assert(cfg.world.width == 64 && cfg.world.height == 64);
    assert(cfg.world.wrapX && cfg.world.wrapY);
    assert(cfg.randomness.seed == 42);
    assert(cfg.fields.size() == 4);
    assert(cfg.fields[3].name == "movement_cost" && cfg.fields[3].derived);
    assert(cfg.heat.direction == climate::HotEdge::North);
    assert(cfg.heat.amplitude == 0.6f);
    assert(cfg.outputs.checkpointInterval == 100);
    assert(cfg.passes.diffusion && cfg.passes.advection && cfg.passes.coupling);
    std::cout << "PASSED" << std::endl;
}

void test_json_preserves_scenario() {
    std::cout << "Running test_json_preserves_scenario..." << std::endl;
    ScenarioConfig cfg = defaultScenario();
    cfg.randomness.streamSalts["hydrology"] = 5;
    cfg.heat.direction = climate::HotEdge::Equator;
    cfg.passes.advection = false;

    ScenarioConfig back = scenarioFromJson(scenarioToJson(cfg));
    assert(scenarioHash(back) == scenarioHash(cfg));
    assert(back.randomness.streamSalts.at("hydrology") == 5);
    assert(back.heat.direction == climate::HotEdge::Equator);
    assert(!back.passes.advection);
    assert(back.fields[1].couplings.size() == 2);
    assert(back.fields[1].couplings[0].kind == field::CouplingKind::Evaporation);
    std::cout << "PASSED" << std::endl;
}

void test_partial_json_uses_defaults() {
    std::cout << "Running test_partial_json_uses_defaults..." << std::endl;
    json j = {{"world", {{"width", 32}}}, {"heat", {{"direction", "south_hot"}}}};
    ScenarioConfig cfg = scenarioFromJson(j);
    assert(cfg.world.width == 32);
    assert(cfg.world.height == 64);
    assert(cfg.heat.direction == climate::HotEdge::South);
    assert(cfg.fields.size() == 4);
    std::cout << "PASSED" << std::endl;
}

void test_malformed_json() {
    std::cout << "Running test_malformed_json..." << std::endl;
    assert(throwsType<ConfigError>([] { scenarioFromJson(json{{"world", {{"width", "wide"}}}}); }));
    assert(throwsType<ConfigError>([] { scenarioFromJson(json::array()); }));
    assert(throwsType<ConfigError>([] { scenarioFromJson(json{{"world", {{"width", 0}}}}); }));
    assert(throwsType<ConfigError>([] { scenarioFromJson(json{{"heat", {{"direction", "west"}}}}); }));
    assert(throwsType<ConfigError>([] { scenarioFromJson(json{{"outputs", {{"checkpoint_interval", 0}}}}); }));

    json badKind = {{"fields", {{{"name", "a"}, {"couplings", {{{"kind", "osmosis"}, {"source", "a"}}}}}}}};
    assert(throwsType<ConfigError>([&] { scenarioFromJson(badKind); }));
    std::cout << "PASSED" << std::endl;
}

void test_pass_order() {
    std::cout << "Running test_pass_order..." << std::endl;
    ScenarioConfig cfg = scenarioFromJson(json{{"passes", {"diffusion", "clip", "derived"}}});
    assert(cfg.passes.diffusion);
    assert(!cfg.passes.advection);
    assert(!cfg.passes.coupling);

    assert(throwsType<ConfigError>([] { scenarioFromJson(json{{"passes", {"advection", "diffusion"}}}); }));
    assert(throwsType<ConfigError>([] { scenarioFromJson(json{{"passes", {"diffusion", "diffusion"}}}); }));
    assert(throwsType<ConfigError>([] { scenarioFromJson(json{{"passes", {"erosion"}}}); }));
    std::cout << "PASSED" << std::endl;
}

void test_file_io() {
    std::cout << "Running test_file_io..." << std::endl;
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() / "envgrid_test_scenario";
    fs::remove_all(dir);
    fs::create_directories(dir);

    ScenarioConfig cfg = defaultScenario();
    cfg.name = "file-io";
    cfg.randomness.seed = 1234;
    saveScenario(cfg, (dir / "s.json").string());
    ScenarioConfig back = loadScenario((dir / "s.json").string());
    assert(back.name == "file-io");
    assert(back.randomness.seed == 1234);
    assert(scenarioHash(back) == scenarioHash(cfg));

    assert(throwsType<ConfigError>([&] { loadScenario((dir / "missing.json").string()); }));

    {
        std::ofstream broken(dir / "broken.json");
        broken << "{ \"world\": ";
    }
    assert(throwsType<ConfigError>([&] { loadScenario((dir / "broken.json").string()); }));

    fs::remove_all(dir);
    std::cout << "PASSED" << std::endl;
}

void test_hash_tracks_content() {
    std::cout << "Running test_hash_tracks_content..." << std::endl;
    ScenarioConfig a = defaultScenario();
    ScenarioConfig b = defaultScenario();
    assert(scenarioHash(a) == scenarioHash(b));
    b.randomness.seed = 43;
    assert(scenarioHash(a) != scenarioHash(b));
    std::cout << "PASSED" << std::endl;
}

int main() {
    test_defaults();
    test_json_preserves_scenario();
    test_partial_json_uses_defaults();
    test_malformed_json();
    test_pass_order();
    test_file_io();
    test_hash_tracks_content();
    std::cout << "ALL TESTS PASSED" << std::endl;
    return 0;
}
