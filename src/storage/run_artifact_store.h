#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include "delta_encoder.h"
#include "../core/scenario_config.h"
#include "../field/field_registry.h"
#include "../grid/grid_tensor.h"
#include "../terrain/hydrology_report.h"

namespace storage {

struct StoreOptions {
    bool overwrite = false;  // Remove an existing run's files from the target directory first
    std::string label;       // Free text recorded in the manifest
};

/**
 * @brief Exclusive, append-only writer for one run directory.
 *
 * Lifecycle: construct (manifest, scenario, initial tensor, tick-0 metrics)
 * -> append once per tick -> seal (checksums). Nothing written is modified
 * afterwards. The delta frame of a tick is flushed before its checkpoint and
 * metrics rows, so a killed process leaves a readable prefix.
 */
class RunArtifactStore {
public:
    // Throws core::StorageError if the directory cannot be created or
    // already holds run files and overwrite is off.
    RunArtifactStore(const std::filesystem::path& runDir, const core::ScenarioConfig& cfg,
                     const field::FieldRegistry& registry, const grid::GridTensor& initial,
                     const terrain::HydrologyStats& hydrology, const StoreOptions& options = {});

    RunArtifactStore(const RunArtifactStore&) = delete;
    RunArtifactStore& operator=(const RunArtifactStore&) = delete;

    // tick must be lastTick() + 1. Throws core::StorageError when sealed or on I/O failure.
    void append(const DeltaRecord& delta, const grid::GridTensor& tensor);

    // Writes seal.json and checksums.json. Throws core::StorageError if already sealed.
    void seal();

    bool sealed() const { return sealed_; }
    uint64_t lastTick() const { return lastTick_; }
    const std::filesystem::path& runDir() const { return runDir_; }
    const std::vector<std::string>& files() const { return files_; }

    // True if the directory holds anything a run would write.
    static bool containsRun(const std::filesystem::path& runDir);

    // Removes the run layout entries and leftover *.tmp files. Other
    // files in the directory are kept.
    static void removeRun(const std::filesystem::path& runDir);

private:
    void writeText(const std::string& rel, const std::string& text);
    void appendText(std::ofstream& stream, const std::string& text, const char* what);
    void writeMetrics(const grid::GridTensor& tensor, uint64_t tick);

    std::filesystem::path runDir_;
    field::FieldRegistry registry_;
    int checkpointInterval_;
    int metricsCadence_;

    std::ofstream deltas_;
    std::ofstream fieldStats_;
    std::ofstream structure_;
    std::ofstream hydrologyCsv_;
    terrain::HydrologyStats hydrology_;
    float riverPercentile_;

    std::vector<std::string> files_;  // Relative paths, in write order
    uint64_t lastTick_ = 0;
    bool sealed_ = false;
    std::chrono::steady_clock::time_point started_;
};

} // namespace storage
