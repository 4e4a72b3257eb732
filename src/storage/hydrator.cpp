#include "hydrator.h"
#include "binary_io.h"
#include "checksum.h"
#include "delta_encoder.h"
#include "run_layout.h"
#include "../core/errors.h"
#include "../log.h"
#include <utility>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace storage {

namespace {

json parseJson(const std::string& text, const std::string& name) {
    try {
        return json::parse(text);
    } catch (const json::exception& e) {
        throw core::CorruptionError(name + " is not valid JSON: " + e.what());
    }
}

} // namespace

Hydrator::Hydrator(const fs::path& runDir) : runDir_(runDir) {
    if (!fs::is_directory(runDir_)) {
        throw core::NotFoundError("run directory " + runDir_.string() + " does not exist");
    }

    sealed_ = fs::exists(runDir_ / layout::SEAL);
    if (sealed_) {
        json sums = parseJson(readFileBytes(runDir_ / layout::CHECKSUMS), layout::CHECKSUMS);
        try {
            for (auto it = sums.at("files").begin(); it != sums.at("files").end(); ++it) {
                checksums_[it.key()] = it.value().get<std::string>();
            }
        } catch (const json::exception& e) {
            throw core::CorruptionError(std::string("checksums.json is malformed: ") + e.what());
        }
    }

    json manifest = parseJson(loadVerified(layout::MANIFEST), layout::MANIFEST);
    try {
        height_ = manifest.at("world").at("height").get<int>();
        width_ = manifest.at("world").at("width").get<int>();
        checkpointInterval_ = manifest.at("checkpoint_interval").get<int>();
    } catch (const json::exception& e) {
        throw core::CorruptionError(std::string("manifest.json is malformed: ") + e.what());
    }
    if (height_ < 1 || width_ < 1 || checkpointInterval_ < 1) {
        throw core::CorruptionError("manifest.json declares an invalid grid or checkpoint interval");
    }

    json scenario = parseJson(loadVerified(layout::SCENARIO), layout::SCENARIO);
    try {
        scenario_ = core::scenarioFromJson(scenario);
        registry_ = field::FieldRegistry::build(scenario_.fields);
    } catch (const core::ConfigError& e) {
        throw core::CorruptionError(std::string("scenario.json is inconsistent: ") + e.what());
    }

    if (sealed_) {
        json seal = parseJson(readFileBytes(runDir_ / layout::SEAL), layout::SEAL);
        try {
            lastTick_ = seal.at("last_tick").get<uint64_t>();
        } catch (const json::exception& e) {
            throw core::CorruptionError(std::string("seal.json is malformed: ") + e.what());
        }
    } else {
        // Killed or still-running writer: readable up to the last complete frame
        logMessage(LogLevel::Warn, "[Hydrator] Run %s is not sealed; reading without checksum verification\n",
                   runDir_.string().c_str());
        lastTick_ = 0;
        if (fs::exists(runDir_ / layout::DELTAS)) {
            DeltaLogReader reader(readFileBytes(runDir_ / layout::DELTAS), true);
            uint64_t tick = 0;
            while (reader.skip(tick)) {
                lastTick_ = tick;
            }
        }
    }

    logMessage(LogLevel::Info, "[Hydrator] Opened %s: %dx%d, %d fields, ticks 0..%llu\n",
               runDir_.string().c_str(), height_, width_, registry_.size(),
               static_cast<unsigned long long>(lastTick_));
}

std::string Hydrator::loadVerified(const std::string& rel) const {
    const fs::path path = runDir_ / rel;
    if (!fs::exists(path)) {
        throw core::NotFoundError("run file " + rel + " is missing");
    }
    std::string bytes = readFileBytes(path);

    if (sealed_) {
        auto it = checksums_.find(rel);
        if (it == checksums_.end()) {
            throw core::CorruptionError("no checksum recorded for " + rel);
        }
        Fnv1a64 digest;
        digest.update(bytes.data(), bytes.size());
        if (toHex(digest.value()) != it->second) {
            throw core::CorruptionError("checksum mismatch for " + rel);
        }
    }
    return bytes;
}

grid::GridTensor Hydrator::loadBase(uint64_t baseTick) const {
    const std::string rel = baseTick == 0 ? std::string(layout::INITIAL) : layout::checkpoint(baseTick);
    // Parse the verified bytes, not a second read of the file
    TensorFile file = parseTensorBytes(loadVerified(rel), rel);

    if (file.tensor.height() != height_ || file.tensor.width() != width_ ||
        file.tensor.fields() != registry_.size()) {
        throw core::CorruptionError(rel + ": shape does not match the manifest");
    }
    if (file.tick != baseTick) {
        throw core::CorruptionError(rel + ": records tick " + std::to_string(file.tick));
    }
    return std::move(file.tensor);
}

grid::GridTensor Hydrator::reconstruct(uint64_t tick) const {
    if (tick > lastTick_) {
        throw core::NotFoundError("tick " + std::to_string(tick) + " is outside the recorded range 0.." +
                                  std::to_string(lastTick_));
    }

    const uint64_t interval = static_cast<uint64_t>(checkpointInterval_);
    uint64_t baseTick = (tick / interval) * interval;
    // A writer killed between a delta frame and its checkpoint leaves the
    // frame without the checkpoint; replay from an earlier base instead.
    while (!sealed_ && baseTick > 0 && !fs::exists(runDir_ / layout::checkpoint(baseTick))) {
        logMessage(LogLevel::Warn, "[Hydrator] Checkpoint for tick %llu is missing; replaying from an earlier base\n",
                   static_cast<unsigned long long>(baseTick));
        baseTick -= interval;
    }
    grid::GridTensor tensor = loadBase(baseTick);
    if (baseTick == tick) return tensor;

    const std::string bytes = loadVerified(layout::DELTAS);
    DeltaLogReader reader(bytes, !sealed_);

    uint64_t expected = 1;
    uint64_t frameTick = 0;
    while (expected <= baseTick) {
        if (!reader.skip(frameTick)) break;
        if (frameTick != expected) {
            throw core::CorruptionError("delta log out of order: frame for tick " + std::to_string(frameTick) +
                                        " where " + std::to_string(expected) + " was expected");
        }
        ++expected;
    }

    DeltaRecord record;
    while (expected <= tick) {
        if (!reader.next(record)) {
            throw core::CorruptionError("delta log ends before tick " + std::to_string(tick));
        }
        if (record.tick != expected) {
            throw core::CorruptionError("delta log out of order: frame for tick " + std::to_string(record.tick) +
                                        " where " + std::to_string(expected) + " was expected");
        }
        DeltaEncoder::apply(tensor, record);
        ++expected;
    }

    logMessage(LogLevel::Debug, "[Hydrator] Tick %llu from base %llu (%llu frames)\n",
               static_cast<unsigned long long>(tick), static_cast<unsigned long long>(baseTick),
               static_cast<unsigned long long>(tick - baseTick));
    return tensor;
}

} // namespace storage
