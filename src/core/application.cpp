#include "application.h"
#include "errors.h"
#include "scenario_config.h"
#include "version.h"
#include "../field/field_registry.h"
#include "../storage/checksum.h"
#include "../storage/hydrator.h"
#include "../storage/metrics.h"
#include "../storage/run_layout.h"
#include "../storage/binary_io.h"
#include "../world/initial_field_generator.h"
#include "../world/simulation.h"
#include "../log.h"
#include <iostream>
#include <nlohmann/json.hpp>

namespace core {

Application::Application(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        args_.emplace_back(argv[i]);
    }
}

void Application::printUsage() const {
    std::cout << APP_NAME << " " << APP_VERSION << "\n"
              << "Usage:\n"
              << "  envgrid run <scenario.json> <ticks> <run_dir> [label] [--overwrite]\n"
              << "  envgrid inspect <run_dir>\n"
              << "  envgrid init <scenario.json>\n"
              << "  envgrid validate <scenario.json>\n";
}

int Application::run() {
    setLogLevelFromEnv();

    if (args_.empty()) {
        printUsage();
        return 1;
    }

    const std::string& command = args_[0];
    if (command == "run") return runSimulation();
    if (command == "inspect") return inspect();
    if (command == "init") return init();
    if (command == "validate") return validate();

    std::cerr << "Unknown command: " << command << std::endl;
    printUsage();
    return 1;
}

int Application::runSimulation() {
    std::vector<std::string> positional;
    storage::StoreOptions options;
    for (size_t i = 1; i < args_.size(); ++i) {
        if (args_[i] == "--overwrite") options.overwrite = true;
        else positional.push_back(args_[i]);
    }
    if (positional.size() < 3 || positional.size() > 4) {
        printUsage();
        return 1;
    }

    unsigned long long ticks = 0;
    try {
        size_t used = 0;
        ticks = std::stoull(positional[1], &used);
        if (used != positional[1].size()) throw std::invalid_argument(positional[1]);
    } catch (const std::exception&) {
        throw ConfigError("tick count must be a non-negative integer, got '" + positional[1] + "'");
    }
    if (positional.size() == 4) options.label = positional[3];

    ScenarioConfig cfg = loadScenario(positional[0]);
    world::runHeadless(cfg, ticks, positional[2], options);
    std::cout << positional[2] << std::endl;
    return 0;
}

int Application::inspect() {
    if (args_.size() != 2) {
        printUsage();
        return 1;
    }

    storage::Hydrator hydrator(args_[1]);
    const std::string manifestText = storage::readFileBytes(hydrator.runDir() / storage::layout::MANIFEST);
    nlohmann::json manifest = nlohmann::json::parse(manifestText, nullptr, false);

    nlohmann::json summary;
    summary["label"] = manifest.is_object() ? manifest.value("label", std::string()) : std::string();
    summary["scenario_hash"] = manifest.is_object() ? manifest.value("scenario_hash", std::string()) : std::string();
    summary["sealed"] = hydrator.sealed();
    summary["last_tick"] = hydrator.lastTick();
    summary["grid"] = {hydrator.height(), hydrator.width(), hydrator.registry().size()};
    summary["fields"] = hydrator.fieldNames();
    std::cout << summary.dump() << std::endl;

    // Statistics of the last recorded tick, rebuilt from the artifacts
    grid::GridTensor last = hydrator.reconstruct(hydrator.lastTick());
    std::cout << "tick,field,mean,var,min,max\n"
              << storage::Metrics::fieldStatsRows(last, hydrator.registry(), hydrator.lastTick());
    return 0;
}

int Application::init() {
    if (args_.size() != 2) {
        printUsage();
        return 1;
    }
    saveScenario(defaultScenario(), args_[1]);
    std::cout << args_[1] << std::endl;
    return 0;
}

int Application::validate() {
    if (args_.size() != 2) {
        printUsage();
        return 1;
    }
    ScenarioConfig cfg = loadScenario(args_[1]);
    field::FieldRegistry registry = field::FieldRegistry::build(cfg.fields);
    world::InitialFieldGenerator::validate(cfg, registry);
    std::cout << storage::toHex(scenarioHash(cfg)) << std::endl;
    return 0;
}

} // namespace core
