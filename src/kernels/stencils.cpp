#include "stencils.h"
#include <algorithm>
#include <cmath>

namespace kernels {

namespace {

inline int neighbour(int i, int n, bool wrap) {
    if (wrap) return ((i % n) + n) % n;
    return std::clamp(i, 0, n - 1);
}

// Positive remainder for the departure point on a periodic axis.
inline float wrapCoord(float v, int n) {
    float r = std::fmod(v, static_cast<float>(n));
    if (r < 0.0f) r += static_cast<float>(n);
    // fmod of a tiny negative value can round up to exactly n
    if (r >= static_cast<float>(n)) r = 0.0f;
    return r;
}

} // namespace

std::vector<float> laplacian5(const std::vector<float>& layer, int width, int height, Boundary boundary) {
    std::vector<float> out(layer.size());

    #pragma omp parallel for
    for (int y = 0; y < height; ++y) {
        const int ym1 = neighbour(y - 1, height, boundary.wrapY);
        const int yp1 = neighbour(y + 1, height, boundary.wrapY);
        for (int x = 0; x < width; ++x) {
            const int xm1 = neighbour(x - 1, width, boundary.wrapX);
            const int xp1 = neighbour(x + 1, width, boundary.wrapX);
            const float c = layer[static_cast<size_t>(y * width + x)];
            out[static_cast<size_t>(y * width + x)] =
                layer[static_cast<size_t>(ym1 * width + x)] +
                layer[static_cast<size_t>(yp1 * width + x)] +
                layer[static_cast<size_t>(y * width + xm1)] +
                layer[static_cast<size_t>(y * width + xp1)] - 4.0f * c;
        }
    }
    return out;
}

std::vector<float> advect(const std::vector<float>& layer, int width, int height,
                          float vx, float vy, Boundary boundary) {
    std::vector<float> out(layer.size());

    #pragma omp parallel for
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            float fx = static_cast<float>(x) - vx;
            float fy = static_cast<float>(y) - vy;

            if (boundary.wrapX) fx = wrapCoord(fx, width);
            else fx = std::clamp(fx, 0.0f, static_cast<float>(width - 1));
            if (boundary.wrapY) fy = wrapCoord(fy, height);
            else fy = std::clamp(fy, 0.0f, static_cast<float>(height - 1));

            const int x0 = static_cast<int>(std::floor(fx));
            const int y0 = static_cast<int>(std::floor(fy));
            const int x1 = boundary.wrapX ? (x0 + 1) % width : std::min(x0 + 1, width - 1);
            const int y1 = boundary.wrapY ? (y0 + 1) % height : std::min(y0 + 1, height - 1);
            const float sx = fx - static_cast<float>(x0);
            const float sy = fy - static_cast<float>(y0);

            const float v00 = layer[static_cast<size_t>(y0 * width + x0)];
            const float v10 = layer[static_cast<size_t>(y0 * width + x1)];
            const float v01 = layer[static_cast<size_t>(y1 * width + x0)];
            const float v11 = layer[static_cast<size_t>(y1 * width + x1)];

            out[static_cast<size_t>(y * width + x)] =
                (1.0f - sx) * (1.0f - sy) * v00 + sx * (1.0f - sy) * v10 +
                (1.0f - sx) * sy * v01 + sx * sy * v11;
        }
    }
    return out;
}

} // namespace kernels
