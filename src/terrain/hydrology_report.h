#pragma once

#include <string>

namespace terrain {

class TerrainMap;

struct HydrologyStats {
    // Structural
    float minElevation = 0.0f;
    float maxElevation = 0.0f;
    float avgElevation = 0.0f;

    // Functional
    float maxFlowAccumulation = 0.0f;
    int sinkCount = 0; // Cells with no downslope receiver

    // Network
    int riverCells = 0;
    int lakeCells = 0;
    int ridgeCells = 0;
    float riverFraction = 0.0f;
    float lakeFraction = 0.0f;
};

class HydrologyReport {
public:
    static HydrologyStats analyze(const TerrainMap& map);

    // One-line human readable summary
    static std::string format(const HydrologyStats& stats);
};

} // namespace terrain
