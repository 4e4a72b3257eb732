#include "hydrology_report.h"
#include "terrain_map.h"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace terrain {

HydrologyStats HydrologyReport::analyze(const TerrainMap& map) {
    HydrologyStats stats;
    const size_t count = map.size();
    if (count == 0) return stats;

    const auto& elev = map.elevation();
    const auto& acc = map.accumulation();

    stats.minElevation = *std::min_element(elev.begin(), elev.end());
    stats.maxElevation = *std::max_element(elev.begin(), elev.end());
    stats.maxFlowAccumulation = *std::max_element(acc.begin(), acc.end());

    double sumElev = 0.0;
    for (size_t i = 0; i < count; ++i) {
        sumElev += elev[i];
        if (map.flowDirMap()[i] == -1) stats.sinkCount++;
        stats.riverCells += map.riverMask()[i];
        stats.lakeCells += map.lakeMask()[i];
        stats.ridgeCells += map.ridgeMask()[i];
    }
    stats.avgElevation = static_cast<float>(sumElev / static_cast<double>(count));
    stats.riverFraction = static_cast<float>(stats.riverCells) / static_cast<float>(count);
    stats.lakeFraction = static_cast<float>(stats.lakeCells) / static_cast<float>(count);
    return stats;
}

std::string HydrologyReport::format(const HydrologyStats& stats) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(3)
       << "elev[" << stats.minElevation << ", " << stats.maxElevation << "] avg " << stats.avgElevation
       << ", rivers " << stats.riverCells << ", lakes " << stats.lakeCells
       << ", ridges " << stats.ridgeCells << ", sinks " << stats.sinkCount
       << ", max acc " << stats.maxFlowAccumulation;
    return ss.str();
}

} // namespace terrain
