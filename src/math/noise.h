#pragma once

#include <array>
#include <cstdint>
#include <vector>

namespace seed { class SeedStream; }

namespace math {

/**
 * @brief Seeded 2D gradient noise sampled as whole rasters.
 *
 * Construction consumes 255 draws for the lattice permutation and two for
 * the sampling window offset, in that order. Equal streams give identical
 * rasters on every platform.
 */
class NoiseField {
public:
    explicit NoiseField(seed::SeedStream& stream);

    // Single lattice octave, [0, 1]
    float sample(float x, float y) const;

    // Normalized octave sum, [0, 1]
    float fractal(float x, float y, int octaves, float persistence) const;

    /**
     * @brief Row-major (height x width) raster of fractal noise.
     *
     * Cell (row, col) samples (col / scale, row / scale) shifted by the
     * stream's window offset. With signedRange the values are mapped to [-1, 1].
     */
    std::vector<float> raster(int width, int height, float scale, int octaves,
                              float persistence, bool signedRange = false) const;

private:
    static float fade(float t);
    static float grad(uint8_t hash, float x, float y);

    std::array<uint8_t, 512> perm_;
    float offsetX_ = 0.0f;
    float offsetY_ = 0.0f;
};

} // namespace math
