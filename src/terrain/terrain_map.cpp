#include "terrain_map.h"
#include <algorithm>

namespace terrain {

TerrainMap::TerrainMap(int width, int height) : width_(width), height_(height) {
    resize(width, height);
}

void TerrainMap::resize(int width, int height) {
    width_ = width;
    height_ = height;
    size_t size = static_cast<size_t>(width) * static_cast<size_t>(height);

    elevation_.assign(size, 0.0f);
    filled_.assign(size, 0.0f);
    accumulation_.assign(size, 1.0f);
    flowDir_.assign(size, -1);
    ridges_.assign(size, 0);
    rivers_.assign(size, 0);
    lakes_.assign(size, 0);
    majorLakes_.assign(size, 0);
}

float TerrainMap::getElevation(int x, int y) const {
    if (!isValid(x, y)) return 0.0f;
    return elevation_[static_cast<size_t>(y * width_ + x)];
}

void TerrainMap::setElevation(int x, int y, float h) {
    if (isValid(x, y)) {
        elevation_[static_cast<size_t>(y * width_ + x)] = h;
    }
}

} // namespace terrain
