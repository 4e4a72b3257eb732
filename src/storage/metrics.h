#pragma once

#include <string>
#include <vector>
#include "../field/field_registry.h"
#include "../grid/grid_tensor.h"
#include "../terrain/hydrology_report.h"

namespace storage {

struct FieldStats {
    double mean = 0.0;
    double variance = 0.0; // Population variance
    double min = 0.0;
    double max = 0.0;
};

class Metrics {
public:
    static FieldStats fieldStats(const grid::GridTensor& tensor, int field);

    // Spatial coherence in roughly [-1, 1]: mean 4-neighbour covariance
    // (periodic neighbours) divided by the variance. Near 1 for smooth
    // layers, near 0 for white noise.
    static double moranLike(const grid::GridTensor& tensor, int field);

    // CSV rows: "tick,field,mean,var,min,max" and "tick,field,moran_like"
    static std::string fieldStatsRows(const grid::GridTensor& tensor, const field::FieldRegistry& registry,
                                      uint64_t tick);
    static std::string structureRows(const grid::GridTensor& tensor, const field::FieldRegistry& registry,
                                     uint64_t tick);

    // "tick,river_length,lake_area,flow_thresholds". Terrain is static, so
    // only the tick changes between rows of one run.
    static std::string hydrologyRow(const terrain::HydrologyStats& hydrology, float riverPercentile,
                                    uint64_t tick);
};

} // namespace storage
