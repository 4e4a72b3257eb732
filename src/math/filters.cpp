#include "filters.h"
#include <algorithm>
#include <cmath>
#include <limits>

namespace math {

namespace {

inline int resolveIndex(int i, int n, bool wrap) {
    if (wrap) {
        i %= n;
        return i < 0 ? i + n : i;
    }
    return std::clamp(i, 0, n - 1);
}

std::vector<float> gaussianKernel(float sigma) {
    const int radius = std::max(1, static_cast<int>(std::ceil(4.0f * sigma)));
    std::vector<float> kernel(static_cast<size_t>(2 * radius + 1));
    double sum = 0.0;
    for (int k = -radius; k <= radius; ++k) {
        double w = std::exp(-0.5 * (static_cast<double>(k) * k) / (static_cast<double>(sigma) * sigma));
        kernel[static_cast<size_t>(k + radius)] = static_cast<float>(w);
        sum += w;
    }
    for (auto& w : kernel) w = static_cast<float>(w / sum);
    return kernel;
}

// 1D squared distance transform (Felzenszwalb & Huttenlocher).
void edt1d(const std::vector<float>& f, std::vector<float>& d, int n,
           std::vector<int>& v, std::vector<float>& z) {
    const float inf = std::numeric_limits<float>::infinity();
    int k = 0;
    v[0] = 0;
    z[0] = -inf;
    z[1] = inf;
    // Skip leading infinite samples; parabolas at +inf never win.
    int first = 0;
    while (first < n && std::isinf(f[static_cast<size_t>(first)])) ++first;
    if (first == n) {
        for (int q = 0; q < n; ++q) d[static_cast<size_t>(q)] = inf;
        return;
    }
    v[0] = first;
    for (int q = first + 1; q < n; ++q) {
        if (std::isinf(f[static_cast<size_t>(q)])) continue;
        float s;
        while (true) {
            const int p = v[static_cast<size_t>(k)];
            s = ((f[static_cast<size_t>(q)] + static_cast<float>(q) * q) -
                 (f[static_cast<size_t>(p)] + static_cast<float>(p) * p)) /
                (2.0f * static_cast<float>(q - p));
            if (s <= z[static_cast<size_t>(k)] && k > 0) {
                --k;
                continue;
            }
            break;
        }
        ++k;
        v[static_cast<size_t>(k)] = q;
        z[static_cast<size_t>(k)] = s;
        z[static_cast<size_t>(k + 1)] = inf;
    }
    k = 0;
    for (int q = 0; q < n; ++q) {
        while (z[static_cast<size_t>(k + 1)] < static_cast<float>(q)) ++k;
        const int p = v[static_cast<size_t>(k)];
        const float dq = static_cast<float>(q - p);
        d[static_cast<size_t>(q)] = dq * dq + f[static_cast<size_t>(p)];
    }
}

} // namespace

void gaussianBlur(std::vector<float>& data, int width, int height, float sigma, bool wrapX, bool wrapY) {
    if (sigma <= 0.0f || width <= 0 || height <= 0) return;
    const std::vector<float> kernel = gaussianKernel(sigma);
    const int radius = static_cast<int>(kernel.size() / 2);
    std::vector<float> tmp(data.size());

    // Horizontal
    #pragma omp parallel for
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            float acc = 0.0f;
            for (int k = -radius; k <= radius; ++k) {
                int sx = resolveIndex(x + k, width, wrapX);
                acc += kernel[static_cast<size_t>(k + radius)] * data[static_cast<size_t>(y * width + sx)];
            }
            tmp[static_cast<size_t>(y * width + x)] = acc;
        }
    }

    // Vertical
    #pragma omp parallel for
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            float acc = 0.0f;
            for (int k = -radius; k <= radius; ++k) {
                int sy = resolveIndex(y + k, height, wrapY);
                acc += kernel[static_cast<size_t>(k + radius)] * tmp[static_cast<size_t>(sy * width + x)];
            }
            data[static_cast<size_t>(y * width + x)] = acc;
        }
    }
}

std::vector<float> distanceTransform(const std::vector<uint8_t>& mask, int width, int height) {
    const float inf = std::numeric_limits<float>::infinity();
    const size_t size = static_cast<size_t>(width) * static_cast<size_t>(height);
    std::vector<float> grid(size);
    for (size_t i = 0; i < size; ++i) {
        grid[i] = mask[i] ? 0.0f : inf;
    }

    const int n = std::max(width, height);
    std::vector<float> f(static_cast<size_t>(n)), d(static_cast<size_t>(n));
    std::vector<int> v(static_cast<size_t>(n));
    std::vector<float> z(static_cast<size_t>(n + 1));

    // Columns
    for (int x = 0; x < width; ++x) {
        for (int y = 0; y < height; ++y) f[static_cast<size_t>(y)] = grid[static_cast<size_t>(y * width + x)];
        edt1d(f, d, height, v, z);
        for (int y = 0; y < height; ++y) grid[static_cast<size_t>(y * width + x)] = d[static_cast<size_t>(y)];
    }
    // Rows
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) f[static_cast<size_t>(x)] = grid[static_cast<size_t>(y * width + x)];
        edt1d(f, d, width, v, z);
        for (int x = 0; x < width; ++x) grid[static_cast<size_t>(y * width + x)] = d[static_cast<size_t>(x)];
    }

    for (auto& g : grid) {
        g = std::isinf(g) ? inf : std::sqrt(g);
    }
    return grid;
}

float quantile(std::vector<float> values, float q) {
    if (values.empty()) return 0.0f;
    std::sort(values.begin(), values.end());
    const double pos = static_cast<double>(std::clamp(q, 0.0f, 1.0f)) * static_cast<double>(values.size() - 1);
    const size_t lo = static_cast<size_t>(std::floor(pos));
    const size_t hi = std::min(lo + 1, values.size() - 1);
    const double frac = pos - static_cast<double>(lo);
    return static_cast<float>(values[lo] + frac * (static_cast<double>(values[hi]) - values[lo]));
}

void normalize01(std::vector<float>& data) {
    if (data.empty()) return;
    auto mm = std::minmax_element(data.begin(), data.end());
    const float lo = *mm.first;
    const float range = *mm.second - lo;
    if (range <= 0.0f) {
        std::fill(data.begin(), data.end(), 0.0f);
        return;
    }
    for (auto& v : data) v = (v - lo) / range;
}

} // namespace math
