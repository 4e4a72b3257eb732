#include "noise.h"
#include "../seed/seed_stream.h"
#include <algorithm>
#include <cmath>

namespace math {

NoiseField::NoiseField(seed::SeedStream& stream) {
    std::array<uint8_t, 256> p;
    for (int i = 0; i < 256; ++i) {
        p[static_cast<size_t>(i)] = static_cast<uint8_t>(i);
    }

    // Fisher-Yates driven by the stream; std::shuffle is implementation-defined
    for (uint32_t i = 255; i > 0; --i) {
        std::swap(p[i], p[stream.nextBelow(i + 1)]);
    }
    for (size_t i = 0; i < 512; ++i) {
        perm_[i] = p[i & 255];
    }

    offsetX_ = stream.uniform(0.0f, 256.0f);
    offsetY_ = stream.uniform(0.0f, 256.0f);
}

float NoiseField::fade(float t) {
    return t * t * t * (t * (t * 6.0f - 15.0f) + 10.0f);
}

float NoiseField::grad(uint8_t hash, float x, float y) {
    const int h = hash & 7;
    const float u = h < 4 ? x : y;
    const float v = h < 4 ? y : x;
    return ((h & 1) ? -u : u) + ((h & 2) ? -v : v);
}

float NoiseField::sample(float x, float y) const {
    const float fx = std::floor(x);
    const float fy = std::floor(y);
    const int xi = static_cast<int>(fx) & 255;
    const int yi = static_cast<int>(fy) & 255;
    x -= fx;
    y -= fy;

    const int a = perm_[static_cast<size_t>(xi)] + yi;
    const int b = perm_[static_cast<size_t>(xi + 1)] + yi;
    const float g00 = grad(perm_[perm_[static_cast<size_t>(a)]], x, y);
    const float g10 = grad(perm_[perm_[static_cast<size_t>(b)]], x - 1.0f, y);
    const float g01 = grad(perm_[perm_[static_cast<size_t>(a + 1)]], x, y - 1.0f);
    const float g11 = grad(perm_[perm_[static_cast<size_t>(b + 1)]], x - 1.0f, y - 1.0f);

    const float u = fade(x);
    const float v = fade(y);
    const float bottom = g00 + u * (g10 - g00);
    const float top = g01 + u * (g11 - g01);
    const float res = bottom + v * (top - bottom);

    // Gradient sums reach +-2 at the extremes
    return std::clamp((res + 1.0f) * 0.5f, 0.0f, 1.0f);
}

float NoiseField::fractal(float x, float y, int octaves, float persistence) const {
    float total = 0.0f;
    float norm = 0.0f;
    float amplitude = 1.0f;
    float frequency = 1.0f;
    for (int i = 0; i < octaves; ++i) {
        total += sample(x * frequency, y * frequency) * amplitude;
        norm += amplitude;
        amplitude *= persistence;
        frequency *= 2.0f;
    }
    return norm > 0.0f ? total / norm : 0.5f;
}

std::vector<float> NoiseField::raster(int width, int height, float scale, int octaves,
                                      float persistence, bool signedRange) const {
    std::vector<float> out(static_cast<size_t>(width) * static_cast<size_t>(height));
    const float inv = 1.0f / scale;

    #pragma omp parallel for
    for (int row = 0; row < height; ++row) {
        for (int col = 0; col < width; ++col) {
            float n = fractal(static_cast<float>(col) * inv + offsetX_,
                              static_cast<float>(row) * inv + offsetY_, octaves, persistence);
            out[static_cast<size_t>(row) * static_cast<size_t>(width) + static_cast<size_t>(col)] =
                signedRange ? n * 2.0f - 1.0f : n;
        }
    }
    return out;
}

} // namespace math
