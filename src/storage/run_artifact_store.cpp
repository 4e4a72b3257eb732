#include "run_artifact_store.h"
#include "binary_io.h"
#include "checksum.h"
#include "metrics.h"
#include "run_layout.h"
#include "../core/errors.h"
#include "../core/version.h"
#include "../log.h"
#include <ctime>
#include <nlohmann/json.hpp>
#include <system_error>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace storage {

namespace {

json hydrologyToJson(const terrain::HydrologyStats& s) {
    return {
        {"river_cells", s.riverCells},
        {"lake_cells", s.lakeCells},
        {"ridge_cells", s.ridgeCells},
        {"sink_cells", s.sinkCount},
        {"max_flow_accumulation", s.maxFlowAccumulation},
        {"river_fraction", s.riverFraction},
        {"lake_fraction", s.lakeFraction}
    };
}

} // namespace

bool RunArtifactStore::containsRun(const fs::path& runDir) {
    std::error_code ec;
    for (const char* rel : {layout::MANIFEST, layout::SCENARIO, layout::SEAL, layout::GRID_DIR, layout::METRICS_DIR}) {
        if (fs::exists(runDir / rel, ec)) return true;
    }
    return false;
}

void RunArtifactStore::removeRun(const fs::path& runDir) {
    std::error_code ec;
    for (const char* rel : {layout::MANIFEST, layout::SCENARIO, layout::SEAL, layout::CHECKSUMS,
                            layout::GRID_DIR, layout::METRICS_DIR}) {
        fs::remove_all(runDir / rel, ec);
        if (ec) {
            throw core::StorageError("cannot remove " + (runDir / rel).string() + ": " + ec.message());
        }
    }

    // Temporaries of an interrupted top-level write
    std::vector<fs::path> leftovers;
    for (fs::directory_iterator it(runDir, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->path().extension() == ".tmp") leftovers.push_back(it->path());
    }
    if (ec) {
        throw core::StorageError("cannot list " + runDir.string() + ": " + ec.message());
    }
    for (const auto& path : leftovers) {
        fs::remove(path, ec);
        if (ec) {
            throw core::StorageError("cannot remove " + path.string() + ": " + ec.message());
        }
    }
}

RunArtifactStore::RunArtifactStore(const fs::path& runDir, const core::ScenarioConfig& cfg,
                                   const field::FieldRegistry& registry, const grid::GridTensor& initial,
                                   const terrain::HydrologyStats& hydrology, const StoreOptions& options)
    : runDir_(runDir),
      registry_(registry),
      checkpointInterval_(cfg.outputs.checkpointInterval),
      metricsCadence_(cfg.outputs.metricsCadence),
      hydrology_(hydrology),
      riverPercentile_(cfg.hydrology.riverPercentile),
      started_(std::chrono::steady_clock::now()) {
    if (initial.fields() != registry.size()) {
        throw core::StateError("initial tensor does not match the field registry");
    }

    if (containsRun(runDir_)) {
        if (!options.overwrite) {
            throw core::StorageError("run directory " + runDir_.string() +
                                     " already contains run files (use overwrite)");
        }
        logMessage(LogLevel::Warn, "[ArtifactStore] Overwriting existing run in %s\n", runDir_.string().c_str());
        removeRun(runDir_);
    }

    std::error_code ec;
    fs::create_directories(runDir_ / layout::CHECKPOINT_DIR, ec);
    if (!ec) fs::create_directories(runDir_ / layout::METRICS_DIR, ec);
    if (ec) {
        throw core::StorageError("cannot create run directory " + runDir_.string() + ": " + ec.message());
    }

    json fields = json::array();
    for (const auto& spec : registry.specs()) {
        fields.push_back({{"name", spec.name}, {"index", spec.index},
                          {"bounds", {spec.lo, spec.hi}}, {"derived", spec.derived}});
    }

    json manifest;
    manifest["schema_version"] = core::ARTIFACT_SCHEMA_VERSION;
    manifest["engine"] = std::string(core::APP_NAME) + " " + std::string(core::APP_VERSION);
    manifest["label"] = options.label;
    manifest["scenario_hash"] = toHex(core::scenarioHash(cfg));
    manifest["seed"] = cfg.randomness.seed;
    manifest["world"] = {{"height", initial.height()}, {"width", initial.width()},
                         {"wrap", {{"x", cfg.world.wrapX}, {"y", cfg.world.wrapY}}}};
    manifest["fields"] = fields;
    manifest["checkpoint_interval"] = checkpointInterval_;
    manifest["metrics_cadence"] = metricsCadence_;
    manifest["hydrology"] = hydrologyToJson(hydrology);
    manifest["created"] = static_cast<int64_t>(std::time(nullptr));

    writeText(layout::MANIFEST, manifest.dump(2) + "\n");
    writeText(layout::SCENARIO, core::scenarioToJson(cfg).dump(2) + "\n");
    files_.push_back(layout::MANIFEST);
    files_.push_back(layout::SCENARIO);

    writeTensorFile(runDir_ / layout::INITIAL, initial, 0);
    files_.push_back(layout::INITIAL);

    deltas_.open(runDir_ / layout::DELTAS, std::ios::binary | std::ios::trunc);
    fieldStats_.open(runDir_ / layout::FIELD_STATS, std::ios::trunc);
    structure_.open(runDir_ / layout::STRUCTURE, std::ios::trunc);
    hydrologyCsv_.open(runDir_ / layout::HYDROLOGY, std::ios::trunc);
    if (!deltas_.is_open() || !fieldStats_.is_open() || !structure_.is_open() || !hydrologyCsv_.is_open()) {
        throw core::StorageError("cannot open run streams in " + runDir_.string());
    }
    files_.push_back(layout::DELTAS);
    files_.push_back(layout::FIELD_STATS);
    files_.push_back(layout::STRUCTURE);
    files_.push_back(layout::HYDROLOGY);

    appendText(fieldStats_, "tick,field,mean,var,min,max\n", layout::FIELD_STATS);
    appendText(structure_, "tick,field,moran_like\n", layout::STRUCTURE);
    appendText(hydrologyCsv_, "tick,river_length,lake_area,flow_thresholds\n", layout::HYDROLOGY);
    writeMetrics(initial, 0);

    logMessage(LogLevel::Info, "[ArtifactStore] Created run at %s (checkpoint every %d ticks)\n",
               runDir_.string().c_str(), checkpointInterval_);
}

void RunArtifactStore::writeText(const std::string& rel, const std::string& text) {
    std::ofstream file(runDir_ / rel, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw core::StorageError("cannot create " + (runDir_ / rel).string());
    }
    file << text;
    file.flush();
    if (!file) {
        throw core::StorageError("failed writing " + (runDir_ / rel).string());
    }
}

void RunArtifactStore::appendText(std::ofstream& stream, const std::string& text, const char* what) {
    stream.write(text.data(), static_cast<std::streamsize>(text.size()));
    stream.flush();
    if (!stream) {
        throw core::StorageError(std::string("failed appending to ") + what);
    }
}

void RunArtifactStore::writeMetrics(const grid::GridTensor& tensor, uint64_t tick) {
    if (tick % static_cast<uint64_t>(metricsCadence_) != 0) return;
    appendText(fieldStats_, Metrics::fieldStatsRows(tensor, registry_, tick), layout::FIELD_STATS);
    appendText(structure_, Metrics::structureRows(tensor, registry_, tick), layout::STRUCTURE);
    appendText(hydrologyCsv_, Metrics::hydrologyRow(hydrology_, riverPercentile_, tick), layout::HYDROLOGY);
}

void RunArtifactStore::append(const DeltaRecord& delta, const grid::GridTensor& tensor) {
    if (sealed_) {
        throw core::StorageError("run " + runDir_.string() + " is sealed");
    }
    if (delta.tick != lastTick_ + 1) {
        throw core::StorageError("append out of order: expected tick " + std::to_string(lastTick_ + 1) +
                                 ", got " + std::to_string(delta.tick));
    }
    if (tensor.fields() != registry_.size()) {
        throw core::StorageError("append: tensor does not match the field registry");
    }

    // Delta first: a checkpoint or metrics row never precedes its frame
    const std::string frame = DeltaEncoder::serialize(delta);
    deltas_.write(frame.data(), static_cast<std::streamsize>(frame.size()));
    deltas_.flush();
    if (!deltas_) {
        throw core::StorageError("failed appending delta for tick " + std::to_string(delta.tick));
    }

    if (delta.tick % static_cast<uint64_t>(checkpointInterval_) == 0) {
        const std::string rel = layout::checkpoint(delta.tick);
        writeTensorFile(runDir_ / rel, tensor, delta.tick);
        files_.push_back(rel);
        logMessage(LogLevel::Debug, "[ArtifactStore] Checkpoint %s\n", rel.c_str());
    }

    writeMetrics(tensor, delta.tick);
    lastTick_ = delta.tick;
}

void RunArtifactStore::seal() {
    if (sealed_) {
        throw core::StorageError("run " + runDir_.string() + " is already sealed");
    }
    deltas_.close();
    fieldStats_.close();
    structure_.close();
    hydrologyCsv_.close();

    json sums = json::object();
    for (const auto& rel : files_) {
        sums[rel] = toHex(fileChecksum(runDir_ / rel));
    }
    json checksums;
    checksums["algorithm"] = "fnv1a64";
    checksums["files"] = sums;

    const double runtime = std::chrono::duration<double>(std::chrono::steady_clock::now() - started_).count();
    json sealDoc;
    sealDoc["last_tick"] = lastTick_;
    sealDoc["runtime_s"] = runtime;
    sealDoc["files"] = files_;
    sealDoc["sealed_at"] = static_cast<int64_t>(std::time(nullptr));

    writeText(layout::CHECKSUMS, checksums.dump(2) + "\n");
    writeText(layout::SEAL, sealDoc.dump(2) + "\n");

    sealed_ = true;
    logMessage(LogLevel::Info, "[ArtifactStore] Sealed %s at tick %llu (%zu files, %.2fs)\n",
               runDir_.string().c_str(), static_cast<unsigned long long>(lastTick_), files_.size(), runtime);
}

} // namespace storage
