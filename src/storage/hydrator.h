#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include "../core/scenario_config.h"
#include "../field/field_registry.h"
#include "../grid/grid_tensor.h"

namespace storage {

/**
 * @brief Rebuilds the tensor of any recorded tick from a run directory.
 *
 * Loads the nearest checkpoint at or before the tick (or the initial tensor)
 * and replays delta frames forward. Unsealed runs fall back to an earlier
 * checkpoint when one is missing. For sealed runs every file read is
 * verified against checksums.json first. Holds no mutable state after
 * construction; concurrent reconstruct() calls are safe.
 */
class Hydrator {
public:
    // Throws core::NotFoundError if the directory, manifest or scenario is
    // missing, core::CorruptionError if they are malformed.
    explicit Hydrator(const std::filesystem::path& runDir);

    // Bit-identical to the live tensor at that tick.
    // Throws core::NotFoundError for ticks past lastTick() or missing files,
    // core::CorruptionError on checksum mismatch or malformed data.
    grid::GridTensor reconstruct(uint64_t tick) const;

    uint64_t lastTick() const { return lastTick_; }
    bool sealed() const { return sealed_; }
    int height() const { return height_; }
    int width() const { return width_; }
    int checkpointInterval() const { return checkpointInterval_; }

    const field::FieldRegistry& registry() const { return registry_; }
    const core::ScenarioConfig& scenario() const { return scenario_; }
    std::vector<std::string> fieldNames() const { return registry_.names(); }
    // Throws core::NotFoundError
    int fieldIndex(const std::string& name) const { return registry_.require(name); }

    const std::filesystem::path& runDir() const { return runDir_; }

private:
    // Raw bytes of a run file, checksum-verified when sealed.
    std::string loadVerified(const std::string& rel) const;
    grid::GridTensor loadBase(uint64_t baseTick) const;

    std::filesystem::path runDir_;
    core::ScenarioConfig scenario_;
    field::FieldRegistry registry_;
    int height_ = 0;
    int width_ = 0;
    int checkpointInterval_ = 1;
    uint64_t lastTick_ = 0;
    bool sealed_ = false;
    std::map<std::string, std::string> checksums_; // rel path -> hex
};

} // namespace storage
