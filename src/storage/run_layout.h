#pragma once

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <string>

namespace storage {

// Relative paths inside a run directory. Checksums are keyed by these.
namespace layout {

    constexpr const char* MANIFEST = "manifest.json";
    constexpr const char* SCENARIO = "scenario.json";
    constexpr const char* INITIAL = "grid/initial.bin";
    constexpr const char* DELTAS = "grid/deltas.bin";
    constexpr const char* CHECKPOINT_DIR = "grid/checkpoints";
    constexpr const char* FIELD_STATS = "metrics/field_stats.csv";
    constexpr const char* STRUCTURE = "metrics/structure.csv";
    constexpr const char* HYDROLOGY = "metrics/hydrology.csv";
    constexpr const char* SEAL = "seal.json";
    constexpr const char* CHECKSUMS = "checksums.json";
    constexpr const char* GRID_DIR = "grid";
    constexpr const char* METRICS_DIR = "metrics";

    inline std::string checkpoint(uint64_t tick) {
        char buf[64];
        std::snprintf(buf, sizeof(buf), "grid/checkpoints/ckpt_%08llu.bin", static_cast<unsigned long long>(tick));
        return std::string(buf);
    }

} // namespace layout

} // namespace storage
