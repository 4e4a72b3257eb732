#include "metrics.h"
#include <Eigen/Dense>
#include <cstdio>

namespace storage {

namespace {

using RowMajorMatrixXf = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using StridedLayer = Eigen::Map<const RowMajorMatrixXf, 0, Eigen::Stride<Eigen::Dynamic, Eigen::Dynamic>>;

// Zero-copy (height x width) view of one field inside the interleaved tensor
StridedLayer layerView(const grid::GridTensor& tensor, int field) {
    return StridedLayer(tensor.data().data() + field, tensor.height(), tensor.width(),
                        Eigen::Stride<Eigen::Dynamic, Eigen::Dynamic>(
                            static_cast<Eigen::Index>(tensor.width()) * tensor.fields(), tensor.fields()));
}

std::string formatValue(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.9g", v);
    return std::string(buf);
}

} // namespace

FieldStats Metrics::fieldStats(const grid::GridTensor& tensor, int field) {
    FieldStats stats;
    if (tensor.cellCount() == 0) return stats;

    const Eigen::MatrixXd layer = layerView(tensor, field).cast<double>();
    stats.mean = layer.mean();
    stats.variance = (layer.array() - stats.mean).square().mean();
    stats.min = layer.minCoeff();
    stats.max = layer.maxCoeff();
    return stats;
}

double Metrics::moranLike(const grid::GridTensor& tensor, int field) {
    const Eigen::Index h = tensor.height();
    const Eigen::Index w = tensor.width();
    if (h == 0 || w == 0) return 0.0;

    const Eigen::MatrixXd layer = layerView(tensor, field).cast<double>();
    const double mean = layer.mean();
    const Eigen::MatrixXd z = layer.array() - mean;
    const double variance = z.array().square().mean() + 1e-8;

    // Periodic shifts by one cell along each axis
    Eigen::MatrixXd west(h, w), east(h, w), north(h, w), south(h, w);
    west.rightCols(w - 1) = z.leftCols(w - 1);
    west.col(0) = z.col(w - 1);
    east.leftCols(w - 1) = z.rightCols(w - 1);
    east.col(w - 1) = z.col(0);
    north.bottomRows(h - 1) = z.topRows(h - 1);
    north.row(0) = z.row(h - 1);
    south.topRows(h - 1) = z.bottomRows(h - 1);
    south.row(h - 1) = z.row(0);

    const double cov = (z.array() * (west + east + north + south).array()).sum() /
                       (4.0 * static_cast<double>(h * w));
    return cov / variance;
}

std::string Metrics::fieldStatsRows(const grid::GridTensor& tensor, const field::FieldRegistry& registry,
                                    uint64_t tick) {
    std::string out;
    for (const auto& spec : registry.specs()) {
        FieldStats s = fieldStats(tensor, spec.index);
        out += std::to_string(tick) + "," + spec.name + "," + formatValue(s.mean) + "," +
               formatValue(s.variance) + "," + formatValue(s.min) + "," + formatValue(s.max) + "\n";
    }
    return out;
}

std::string Metrics::structureRows(const grid::GridTensor& tensor, const field::FieldRegistry& registry,
                                   uint64_t tick) {
    std::string out;
    for (const auto& spec : registry.specs()) {
        if (spec.derived) continue;
        out += std::to_string(tick) + "," + spec.name + "," + formatValue(moranLike(tensor, spec.index)) + "\n";
    }
    return out;
}

std::string Metrics::hydrologyRow(const terrain::HydrologyStats& hydrology, float riverPercentile,
                                  uint64_t tick) {
    return std::to_string(tick) + "," + std::to_string(hydrology.riverCells) + "," +
           std::to_string(hydrology.lakeCells) + "," + formatValue(riverPercentile) + "\n";
}

} // namespace storage
