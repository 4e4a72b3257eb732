#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include "../grid/grid_tensor.h"
#include "../storage/hydrator.h"

namespace world {

// Radius-bounded window, clipped at grid edges. Layers are row-major (rows x cols).
struct Neighborhood {
    int rowMin = 0;
    int colMin = 0;
    int rows = 0;
    int cols = 0;
    std::map<std::string, std::vector<float>> layers;
};

struct GridShape {
    int height = 0;
    int width = 0;
    int fields = 0;
};

/**
 * @brief Read-only, tick-scoped view over a reconstructed run.
 *
 * Coordinates are (row, col). Every read before loadTick() is a core::StateError.
 * The hydrator must outlive the grid.
 */
class EnvironmentGrid {
public:
    explicit EnvironmentGrid(const storage::Hydrator& hydrator);

    // Reconstructs and holds the tensor of one tick.
    void loadTick(uint64_t tick);
    bool loaded() const { return loaded_; }
    // Throws core::StateError before the first load
    uint64_t loadedTick() const;

    // Row-major copy of one field (height x width)
    std::vector<float> fieldSlice(const std::string& name) const;
    float cell(int row, int col, const std::string& name) const;
    std::map<std::string, float> allFieldsAt(int row, int col) const;
    Neighborhood neighborhood(int row, int col, int radius = 1) const;

    GridShape shape() const;
    std::vector<std::string> fieldNames() const { return hydrator_.fieldNames(); }

private:
    void requireLoaded() const;
    void requireCell(int row, int col) const;

    const storage::Hydrator& hydrator_;
    grid::GridTensor tensor_;
    uint64_t tick_ = 0;
    bool loaded_ = false;
};

} // namespace world
