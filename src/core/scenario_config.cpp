#include "scenario_config.h"
#include "errors.h"
#include "../seed/seed_stream.h"
#include "../log.h"
#include <algorithm>
#include <fstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace core {

namespace {

template <typename T>
void readKey(const json& obj, const char* key, T& out) {
    auto it = obj.find(key);
    if (it != obj.end()) {
        out = it->get<T>();
    }
}

const json& section(const json& root, const char* key) {
    static const json empty = json::object();
    auto it = root.find(key);
    if (it == root.end()) return empty;
    if (!it->is_object()) {
        throw ConfigError(std::string("section '") + key + "' must be an object");
    }
    return *it;
}

field::Coupling parseCoupling(const json& j, const std::string& owner) {
    if (!j.is_object()) {
        throw ConfigError("coupling on field '" + owner + "' must be an object");
    }
    field::Coupling c;
    std::string kind;
    readKey(j, "kind", kind);
    if (!field::parseCouplingKind(kind, c.kind)) {
        throw ConfigError("field '" + owner + "': unknown coupling kind '" + kind + "'");
    }

    auto src = j.find("source");
    if (src == j.end()) {
        throw ConfigError("field '" + owner + "': coupling without a source");
    }
    if (src->is_string()) {
        c.sourceName = src->get<std::string>();
    } else if (src->is_number_integer()) {
        c.sourceIndex = src->get<int>();
    } else {
        throw ConfigError("field '" + owner + "': coupling source must be a name or an index");
    }

    readKey(j, "rate", c.rate);
    readKey(j, "half", c.half);
    readKey(j, "optimum", c.optimum);
    readKey(j, "sigma", c.sigma);
    return c;
}

field::FieldSpec parseField(const json& j) {
    if (!j.is_object()) {
        throw ConfigError("field entry must be an object");
    }
    field::FieldSpec spec;
    readKey(j, "name", spec.name);

    auto bounds = j.find("bounds");
    if (bounds != j.end()) {
        std::vector<float> b = bounds->get<std::vector<float>>();
        if (b.size() != 2) {
            throw ConfigError("field '" + spec.name + "': bounds must be [lo, hi]");
        }
        spec.lo = b[0];
        spec.hi = b[1];
    }

    readKey(j, "derived", spec.derived);
    readKey(j, "diffusion", spec.diffusion);
    readKey(j, "decay", spec.decay);
    readKey(j, "replenish", spec.replenish);
    readKey(j, "noise", spec.noise);
    readKey(j, "initial", spec.initial);
    readKey(j, "base", spec.derivedBase);
    readKey(j, "ridge_weight", spec.ridgeWeight);

    auto adv = j.find("advection");
    if (adv != j.end()) {
        if (!adv->is_object()) {
            throw ConfigError("field '" + spec.name + "': advection must be an object");
        }
        spec.advection.enabled = true;
        readKey(*adv, "enabled", spec.advection.enabled);
        readKey(*adv, "vx", spec.advection.vx);
        readKey(*adv, "vy", spec.advection.vy);
    }

    auto growth = j.find("growth");
    if (growth != j.end()) {
        if (!growth->is_object()) {
            throw ConfigError("field '" + spec.name + "': growth must be an object");
        }
        readKey(*growth, "rate", spec.growthRate);
        readKey(*growth, "capacity", spec.capacity);
    }

    auto couplings = j.find("couplings");
    if (couplings != j.end()) {
        if (!couplings->is_array()) {
            throw ConfigError("field '" + spec.name + "': couplings must be a list");
        }
        for (const auto& c : *couplings) {
            spec.couplings.push_back(parseCoupling(c, spec.name));
        }
    }
    return spec;
}

json fieldToJson(const field::FieldSpec& spec) {
    json j;
    j["name"] = spec.name;
    j["bounds"] = {spec.lo, spec.hi};
    j["derived"] = spec.derived;
    if (spec.derived) {
        j["base"] = spec.derivedBase;
        j["ridge_weight"] = spec.ridgeWeight;
    } else {
        j["diffusion"] = spec.diffusion;
        j["decay"] = spec.decay;
        j["replenish"] = spec.replenish;
        j["noise"] = spec.noise;
        j["initial"] = spec.initial;
        if (spec.advection.enabled) {
            j["advection"] = {{"enabled", true}, {"vx", spec.advection.vx}, {"vy", spec.advection.vy}};
        }
        if (spec.growthRate > 0.0f) {
            j["growth"] = {{"rate", spec.growthRate}, {"capacity", spec.capacity}};
        }
    }

    json couplings = json::array();
    for (const auto& c : spec.couplings) {
        json jc;
        jc["kind"] = field::couplingKindName(c.kind);
        if (!c.sourceName.empty()) jc["source"] = c.sourceName;
        else jc["source"] = c.sourceIndex;
        jc["rate"] = c.rate;
        if (c.kind == field::CouplingKind::WaterLimit) {
            jc["half"] = c.half;
        } else if (c.kind == field::CouplingKind::HeatLimit) {
            jc["optimum"] = c.optimum;
            jc["sigma"] = c.sigma;
        }
        couplings.push_back(jc);
    }
    j["couplings"] = couplings;
    return j;
}

void parsePasses(const json& list, PassConfig& passes) {
    if (!list.is_array()) {
        throw ConfigError("passes must be a list of pass names");
    }
    const auto& order = canonicalPassOrder();
    passes.diffusion = false;
    passes.advection = false;
    passes.coupling = false;

    int last = -1;
    for (const auto& entry : list) {
        if (!entry.is_string()) {
            throw ConfigError("pass names must be strings");
        }
        const std::string name = entry.get<std::string>();
        auto it = std::find(order.begin(), order.end(), name);
        if (it == order.end()) {
            throw ConfigError("unknown kernel pass '" + name + "'");
        }
        int pos = static_cast<int>(it - order.begin());
        if (pos <= last) {
            throw ConfigError("kernel pass '" + name + "' is out of order or repeated");
        }
        last = pos;

        if (name == "diffusion") passes.diffusion = true;
        else if (name == "advection") passes.advection = true;
        else if (name == "coupling") passes.coupling = true;
    }
}

} // namespace

const std::vector<std::string>& canonicalPassOrder() {
    static const std::vector<std::string> order = {
        "diffusion", "advection", "coupling", "clip", "derived"
    };
    return order;
}

ScenarioConfig defaultScenario() {
    ScenarioConfig cfg;
    const vegetation::VegetationProfile& vp = cfg.vegetation;

    field::FieldSpec temperature;
    temperature.name = "temperature";
    temperature.diffusion = 0.18f;

    field::FieldSpec hydration;
    hydration.name = "hydration";
    hydration.diffusion = 0.12f;
    {
        field::Coupling evap;
        evap.kind = field::CouplingKind::Evaporation;
        evap.sourceName = "temperature";
        evap.rate = 0.005f;
        field::Coupling consume;
        consume.kind = field::CouplingKind::Consumption;
        consume.sourceName = "vegetation";
        consume.rate = 0.5f;
        hydration.couplings = {evap, consume};
    }

    field::FieldSpec veg;
    veg.name = "vegetation";
    veg.diffusion = 0.05f;
    veg.growthRate = vp.k;
    veg.capacity = vp.carryingCapacity;
    {
        field::Coupling water;
        water.kind = field::CouplingKind::WaterLimit;
        water.sourceName = "hydration";
        water.half = vp.waterHalf;
        field::Coupling heat;
        heat.kind = field::CouplingKind::HeatLimit;
        heat.sourceName = "temperature";
        heat.optimum = vp.heatOptimum;
        heat.sigma = vp.heatSigma;
        veg.couplings = {water, heat};
    }

    // 0.3 + 0.5 * vegetation + 0.2 * (1 - hydration)
    field::FieldSpec cost;
    cost.name = "movement_cost";
    cost.derived = true;
    cost.derivedBase = 0.3f;
    {
        field::Coupling v;
        v.kind = field::CouplingKind::Linear;
        v.sourceName = "vegetation";
        v.rate = 0.5f;
        field::Coupling h;
        h.kind = field::CouplingKind::Inverse;
        h.sourceName = "hydration";
        h.rate = 0.2f;
        cost.couplings = {v, h};
    }

    cfg.fields = {temperature, hydration, veg, cost};
    return cfg;
}

ScenarioConfig scenarioFromJson(const json& j) {
    if (!j.is_object()) {
        throw ConfigError("scenario must be a JSON object");
    }

    ScenarioConfig cfg = defaultScenario();
    try {
        readKey(j, "name", cfg.name);

        const json& world = section(j, "world");
        readKey(world, "width", cfg.world.width);
        readKey(world, "height", cfg.world.height);
        const json& wrap = section(world, "wrap");
        readKey(wrap, "x", cfg.world.wrapX);
        readKey(wrap, "y", cfg.world.wrapY);

        const json& rnd = section(j, "randomness");
        readKey(rnd, "seed", cfg.randomness.seed);
        const json& salts = section(rnd, "stream_salts");
        for (auto it = salts.begin(); it != salts.end(); ++it) {
            cfg.randomness.streamSalts[it.key()] = it.value().get<uint64_t>();
        }

        auto fields = j.find("fields");
        if (fields != j.end()) {
            if (!fields->is_array()) {
                throw ConfigError("fields must be a list");
            }
            cfg.fields.clear();
            for (const auto& f : *fields) {
                cfg.fields.push_back(parseField(f));
            }
        }

        const json& hyd = section(j, "hydrology");
        terrain::HydrologyProfile& hp = cfg.hydrology;
        readKey(hyd, "elevation_scale", hp.elevationScale);
        readKey(hyd, "octaves", hp.octaves);
        readKey(hyd, "persistence", hp.persistence);
        readKey(hyd, "ridge_strength", hp.ridgeStrength);
        readKey(hyd, "ridge_threshold", hp.ridgeThreshold);
        readKey(hyd, "river_percentile", hp.riverPercentile);
        readKey(hyd, "lake_fill_threshold", hp.lakeFillThreshold);
        readKey(hyd, "lake_min_depth", hp.lakeMinDepth);
        readKey(hyd, "base_moisture", hp.baseMoisture);
        readKey(hyd, "river_depth", hp.riverDepth);
        readKey(hyd, "lake_depth", hp.lakeDepth);
        readKey(hyd, "river_decay", hp.riverDecay);
        readKey(hyd, "lake_decay", hp.lakeDecay);
        readKey(hyd, "lowland_bonus", hp.lowlandBonus);
        readKey(hyd, "smoothing_sigma", hp.smoothingSigma);

        const json& heat = section(j, "heat");
        std::string direction = climate::hotEdgeName(cfg.heat.direction);
        readKey(heat, "direction", direction);
        if (!climate::parseHotEdge(direction, cfg.heat.direction)) {
            throw ConfigError("unknown heat direction '" + direction + "'");
        }
        readKey(heat, "amplitude", cfg.heat.amplitude);
        readKey(heat, "noise_amp", cfg.heat.noiseAmp);
        readKey(heat, "noise_scale", cfg.heat.noiseScale);

        const json& veg = section(j, "vegetation");
        vegetation::VegetationProfile& vp = cfg.vegetation;
        readKey(veg, "k", vp.k);
        readKey(veg, "water_half", vp.waterHalf);
        readKey(veg, "heat_optimum", vp.heatOptimum);
        readKey(veg, "heat_sigma", vp.heatSigma);
        readKey(veg, "carrying_capacity", vp.carryingCapacity);
        readKey(veg, "noise_amp", vp.noiseAmp);
        readKey(veg, "noise_scale", vp.noiseScale);

        auto passes = j.find("passes");
        if (passes != j.end()) {
            parsePasses(*passes, cfg.passes);
        }

        const json& out = section(j, "outputs");
        readKey(out, "checkpoint_interval", cfg.outputs.checkpointInterval);
        readKey(out, "metrics_cadence", cfg.outputs.metricsCadence);
    } catch (const json::exception& e) {
        throw ConfigError(std::string("malformed scenario: ") + e.what());
    }

    if (cfg.world.width < 1 || cfg.world.height < 1) {
        throw ConfigError("world dimensions must be positive");
    }
    if (cfg.outputs.checkpointInterval < 1) {
        throw ConfigError("checkpoint_interval must be >= 1");
    }
    if (cfg.outputs.metricsCadence < 1) {
        throw ConfigError("metrics_cadence must be >= 1");
    }
    return cfg;
}

json scenarioToJson(const ScenarioConfig& cfg) {
    json j;
    j["name"] = cfg.name;
    j["world"] = {
        {"width", cfg.world.width},
        {"height", cfg.world.height},
        {"wrap", {{"x", cfg.world.wrapX}, {"y", cfg.world.wrapY}}}
    };

    json salts = json::object();
    for (const auto& kv : cfg.randomness.streamSalts) {
        salts[kv.first] = kv.second;
    }
    j["randomness"] = {{"seed", cfg.randomness.seed}, {"stream_salts", salts}};

    json fields = json::array();
    for (const auto& spec : cfg.fields) {
        fields.push_back(fieldToJson(spec));
    }
    j["fields"] = fields;

    const terrain::HydrologyProfile& hp = cfg.hydrology;
    j["hydrology"] = {
        {"elevation_scale", hp.elevationScale},
        {"octaves", hp.octaves},
        {"persistence", hp.persistence},
        {"ridge_strength", hp.ridgeStrength},
        {"ridge_threshold", hp.ridgeThreshold},
        {"river_percentile", hp.riverPercentile},
        {"lake_fill_threshold", hp.lakeFillThreshold},
        {"lake_min_depth", hp.lakeMinDepth},
        {"base_moisture", hp.baseMoisture},
        {"river_depth", hp.riverDepth},
        {"lake_depth", hp.lakeDepth},
        {"river_decay", hp.riverDecay},
        {"lake_decay", hp.lakeDecay},
        {"lowland_bonus", hp.lowlandBonus},
        {"smoothing_sigma", hp.smoothingSigma}
    };

    j["heat"] = {
        {"direction", climate::hotEdgeName(cfg.heat.direction)},
        {"amplitude", cfg.heat.amplitude},
        {"noise_amp", cfg.heat.noiseAmp},
        {"noise_scale", cfg.heat.noiseScale}
    };

    const vegetation::VegetationProfile& vp = cfg.vegetation;
    j["vegetation"] = {
        {"k", vp.k},
        {"water_half", vp.waterHalf},
        {"heat_optimum", vp.heatOptimum},
        {"heat_sigma", vp.heatSigma},
        {"carrying_capacity", vp.carryingCapacity},
        {"noise_amp", vp.noiseAmp},
        {"noise_scale", vp.noiseScale}
    };

    json passes = json::array();
    if (cfg.passes.diffusion) passes.push_back("diffusion");
    if (cfg.passes.advection) passes.push_back("advection");
    if (cfg.passes.coupling) passes.push_back("coupling");
    passes.push_back("clip");
    passes.push_back("derived");
    j["passes"] = passes;

    j["outputs"] = {
        {"checkpoint_interval", cfg.outputs.checkpointInterval},
        {"metrics_cadence", cfg.outputs.metricsCadence}
    };
    return j;
}

ScenarioConfig loadScenario(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("cannot open scenario file: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::exception& e) {
        throw ConfigError("scenario " + path + " is not valid JSON: " + e.what());
    }

    ScenarioConfig cfg = scenarioFromJson(j);
    logMessage(LogLevel::Info, "[Scenario] Loaded '%s' from %s (%dx%d, %zu fields)\n",
               cfg.name.c_str(), path.c_str(), cfg.world.width, cfg.world.height, cfg.fields.size());
    return cfg;
}

void saveScenario(const ScenarioConfig& cfg, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw StorageError("cannot write scenario file: " + path);
    }
    file << scenarioToJson(cfg).dump(2) << "\n";
    if (!file) {
        throw StorageError("failed writing scenario file: " + path);
    }
}

uint64_t scenarioHash(const ScenarioConfig& cfg) {
    return seed::fnv1a64(scenarioToJson(cfg).dump());
}

} // namespace core
