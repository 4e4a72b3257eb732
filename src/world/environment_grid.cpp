#include "environment_grid.h"
#include "../core/errors.h"
#include <algorithm>
#include <utility>

namespace world {

EnvironmentGrid::EnvironmentGrid(const storage::Hydrator& hydrator) : hydrator_(hydrator) {
}

void EnvironmentGrid::loadTick(uint64_t tick) {
    // A failed load leaves the previous tick in place
    grid::GridTensor tensor = hydrator_.reconstruct(tick);
    tensor_ = std::move(tensor);
    tick_ = tick;
    loaded_ = true;
}

uint64_t EnvironmentGrid::loadedTick() const {
    requireLoaded();
    return tick_;
}

void EnvironmentGrid::requireLoaded() const {
    if (!loaded_) {
        throw core::StateError("no tick loaded; call loadTick() first");
    }
}

void EnvironmentGrid::requireCell(int row, int col) const {
    if (!tensor_.inBounds(row, col)) {
        throw core::NotFoundError("cell (" + std::to_string(row) + ", " + std::to_string(col) +
                                  ") is outside the grid");
    }
}

std::vector<float> EnvironmentGrid::fieldSlice(const std::string& name) const {
    requireLoaded();
    return tensor_.fieldSlice(hydrator_.fieldIndex(name));
}

float EnvironmentGrid::cell(int row, int col, const std::string& name) const {
    requireLoaded();
    const int field = hydrator_.fieldIndex(name);
    requireCell(row, col);
    return tensor_.at(row, col, field);
}

std::map<std::string, float> EnvironmentGrid::allFieldsAt(int row, int col) const {
    requireLoaded();
    requireCell(row, col);
    std::map<std::string, float> out;
    for (const auto& spec : hydrator_.registry().specs()) {
        out[spec.name] = tensor_.at(row, col, spec.index);
    }
    return out;
}

Neighborhood EnvironmentGrid::neighborhood(int row, int col, int radius) const {
    requireLoaded();
    requireCell(row, col);
    if (radius < 0) {
        throw core::NotFoundError("neighborhood radius must be >= 0");
    }

    Neighborhood n;
    const long long r = radius;
    n.rowMin = static_cast<int>(std::max<long long>(0, row - r));
    n.colMin = static_cast<int>(std::max<long long>(0, col - r));
    const int rowMax = static_cast<int>(std::min<long long>(tensor_.height(), row + r + 1));
    const int colMax = static_cast<int>(std::min<long long>(tensor_.width(), col + r + 1));
    n.rows = rowMax - n.rowMin;
    n.cols = colMax - n.colMin;

    for (const auto& spec : hydrator_.registry().specs()) {
        std::vector<float> layer;
        layer.reserve(static_cast<size_t>(n.rows) * static_cast<size_t>(n.cols));
        for (int y = n.rowMin; y < rowMax; ++y) {
            for (int x = n.colMin; x < colMax; ++x) {
                layer.push_back(tensor_.at(y, x, spec.index));
            }
        }
        n.layers[spec.name] = std::move(layer);
    }
    return n;
}

GridShape EnvironmentGrid::shape() const {
    return GridShape{hydrator_.height(), hydrator_.width(), hydrator_.registry().size()};
}

} // namespace world
