#include "terrain_generator.h"
#include "../log.h"
#include "../math/filters.h"
#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>
#include <numeric>
#include <queue>
#include <utility>
#include <vector>

namespace terrain {

namespace {

inline int wrapOrClip(int i, int n, bool wrap) {
    if (wrap) return ((i % n) + n) % n;
    return (i >= 0 && i < n) ? i : -1;
}

} // namespace

TerrainGenerator::TerrainGenerator(seed::SeedStream stream)
    : noise_(stream) {
}

void TerrainGenerator::generate(TerrainMap& map, const HydrologyProfile& profile, bool wrapX, bool wrapY) {
    logMessage(LogLevel::Info, "[TerrainGenerator] Generating terrain (%dx%d)...\n", map.getWidth(), map.getHeight());
    generateElevation(map, profile, wrapX, wrapY);
    calculateDrainage(map, wrapX, wrapY);
    fillDepressions(map, wrapX, wrapY);
    classifyWater(map, profile);
}

void TerrainGenerator::generateElevation(TerrainMap& map, const HydrologyProfile& profile, bool wrapX, bool wrapY) {
    int w = map.getWidth();
    int h = map.getHeight();

    std::vector<float>& elev = map.elevation();
    elev = noise_.raster(w, h, profile.elevationScale, profile.octaves, profile.persistence);

    math::normalize01(elev);

    // Ridged blend: peaks where the base noise crosses its midpoint
    const float s = profile.ridgeStrength;
    for (auto& e : elev) {
        float r = 1.0f - std::fabs(2.0f * e - 1.0f);
        e = (1.0f - s) * e + s * r;
    }
    math::gaussianBlur(elev, w, h, std::max(1.0f, profile.elevationScale / 6.0f), wrapX, wrapY);
    math::normalize01(elev);
}

void TerrainGenerator::calculateDrainage(TerrainMap& map, bool wrapX, bool wrapY) {
    int w = map.getWidth();
    int h = map.getHeight();
    int size = w * h;
    const std::vector<float>& heightMap = map.elevation();
    std::vector<int>& receivers = map.flowDirMap();

    std::fill(map.accumulation().begin(), map.accumulation().end(), 1.0f);

    // 1. Receiver per cell (steepest strictly-lower neighbour)
    #pragma omp parallel for collapse(2)
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            int idx = y * w + x;
            float currentH = heightMap[static_cast<size_t>(idx)];
            float maxSlope = 0.0f;
            int receiver = -1;

            for (int dy = -1; dy <= 1; ++dy) {
                for (int dx = -1; dx <= 1; ++dx) {
                    if (dx == 0 && dy == 0) continue;

                    int nx = wrapOrClip(x + dx, w, wrapX);
                    int ny = wrapOrClip(y + dy, h, wrapY);
                    if (nx < 0 || ny < 0) continue;

                    float drop = currentH - heightMap[static_cast<size_t>(ny * w + nx)];
                    if (drop > 0) {
                        float distFactor = (dx == 0 || dy == 0) ? 1.0f : 1.41421356f;
                        float slope = drop / distFactor;
                        if (slope > maxSlope) {
                            maxSlope = slope;
                            receiver = ny * w + nx;
                        }
                    }
                }
            }
            receivers[static_cast<size_t>(idx)] = receiver;
        }
    }

    // 2. High-to-low order; ties broken by index so the order is total
    std::vector<int> sortedIndices(static_cast<size_t>(size));
    std::iota(sortedIndices.begin(), sortedIndices.end(), 0);
    std::sort(sortedIndices.begin(), sortedIndices.end(), [&](int a, int b) {
        float ha = heightMap[static_cast<size_t>(a)];
        float hb = heightMap[static_cast<size_t>(b)];
        if (ha != hb) return ha > hb;
        return a < b;
    });

    // 3. Accumulate (receivers are strictly lower, so they come later)
    std::vector<float>& acc = map.accumulation();
    for (int idx : sortedIndices) {
        int receiver = receivers[static_cast<size_t>(idx)];
        if (receiver != -1) {
            acc[static_cast<size_t>(receiver)] += acc[static_cast<size_t>(idx)];
        }
    }
}

void TerrainGenerator::fillDepressions(TerrainMap& map, bool wrapX, bool wrapY) {
    int w = map.getWidth();
    int h = map.getHeight();
    const std::vector<float>& elev = map.elevation();
    std::vector<float>& water = map.filledElevation();
    std::fill(water.begin(), water.end(), std::numeric_limits<float>::infinity());

    using Entry = std::pair<float, int>; // (level, index), min-heap is total-ordered
    std::priority_queue<Entry, std::vector<Entry>, std::greater<Entry>> open;
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            if (y == 0 || y == h - 1 || x == 0 || x == w - 1) {
                int idx = y * w + x;
                open.emplace(elev[static_cast<size_t>(idx)], idx);
            }
        }
    }

    const int dx[] = {0, 0, -1, 1};
    const int dy[] = {-1, 1, 0, 0};

    while (!open.empty()) {
        Entry top = open.top();
        open.pop();
        float e = top.first;
        int idx = top.second;
        if (water[static_cast<size_t>(idx)] <= e) continue;
        water[static_cast<size_t>(idx)] = e;

        int cx = idx % w;
        int cy = idx / w;
        for (int i = 0; i < 4; ++i) {
            int nx = wrapOrClip(cx + dx[i], w, wrapX);
            int ny = wrapOrClip(cy + dy[i], h, wrapY);
            if (nx < 0 || ny < 0) continue;
            int nIdx = ny * w + nx;
            float level = std::max(e, elev[static_cast<size_t>(nIdx)]);
            if (level < water[static_cast<size_t>(nIdx)]) {
                open.emplace(level, nIdx);
            }
        }
    }
}

void TerrainGenerator::classifyWater(TerrainMap& map, const HydrologyProfile& profile) {
    const std::vector<float>& elev = map.elevation();
    const std::vector<float>& filled = map.filledElevation();
    const std::vector<float>& acc = map.accumulation();

    const float ridgeLevel = math::quantile(elev, profile.ridgeThreshold);
    const float riverThreshold = math::quantile(acc, profile.riverPercentile);
    const float lakeAccThreshold = math::quantile(acc, 1.0f - profile.lakeFillThreshold);

    size_t rivers = 0, lakes = 0, ridges = 0;
    for (size_t i = 0; i < elev.size(); ++i) {
        map.ridgeMask()[i] = elev[i] >= ridgeLevel ? 1 : 0;
        map.riverMask()[i] = acc[i] >= riverThreshold ? 1 : 0;
        bool major = acc[i] >= lakeAccThreshold;
        bool depression = (filled[i] - elev[i]) > profile.lakeMinDepth;
        map.majorLakeMask()[i] = major ? 1 : 0;
        map.lakeMask()[i] = (depression || major) ? 1 : 0;
        rivers += map.riverMask()[i];
        lakes += map.lakeMask()[i];
        ridges += map.ridgeMask()[i];
    }

    logMessage(LogLevel::Debug, "[TerrainGenerator] rivers=%zu lakes=%zu ridges=%zu\n", rivers, lakes, ridges);
}

} // namespace terrain
