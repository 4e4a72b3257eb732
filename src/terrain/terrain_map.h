#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace terrain {

// Hydrology generation parameters ("water_profile" in the scenario).
struct HydrologyProfile {
    float elevationScale = 32.0f;    // Cells per base noise period
    int octaves = 4;
    float persistence = 0.5f;        // Amplitude multiplier per octave
    float ridgeStrength = 0.4f;      // Blend toward ridged noise
    float ridgeThreshold = 0.8f;     // Elevation quantile; cells at or above it are ridges
    float riverPercentile = 0.92f;   // Accumulation quantile for rivers
    float lakeFillThreshold = 0.15f; // Top accumulation fraction counted as lake
    float lakeMinDepth = 1e-4f;      // Depression depth that counts as lake
    float baseMoisture = 0.3f;
    float riverDepth = 0.9f;
    float lakeDepth = 1.0f;
    float riverDecay = 3.0f;         // Cells, e-folding distance
    float lakeDecay = 5.0f;
    float lowlandBonus = 0.15f;
    float smoothingSigma = 3.0f;
};

/**
 * @brief Static terrain derived once at tick 0 from the hydrology stream.
 *
 * Never persisted as a field; it only feeds hydration at init and the
 * ridge term of derived fields.
 */
class TerrainMap {
public:
    TerrainMap(int width = 0, int height = 0);
    ~TerrainMap() = default;

    void resize(int width, int height);

    int getWidth() const { return width_; }
    int getHeight() const { return height_; }
    std::size_t size() const { return elevation_.size(); }

    float getElevation(int x, int y) const;
    void setElevation(int x, int y, float h);

    std::vector<float>& elevation() { return elevation_; }
    const std::vector<float>& elevation() const { return elevation_; }

    // Priority-flood filled surface
    std::vector<float>& filledElevation() { return filled_; }
    const std::vector<float>& filledElevation() const { return filled_; }

    // Flow accumulation (cells draining through, including self)
    std::vector<float>& accumulation() { return accumulation_; }
    const std::vector<float>& accumulation() const { return accumulation_; }

    // Index of receiver cell (-1 if sink)
    std::vector<int>& flowDirMap() { return flowDir_; }
    const std::vector<int>& flowDirMap() const { return flowDir_; }

    std::vector<uint8_t>& ridgeMask() { return ridges_; }
    const std::vector<uint8_t>& ridgeMask() const { return ridges_; }

    std::vector<uint8_t>& riverMask() { return rivers_; }
    const std::vector<uint8_t>& riverMask() const { return rivers_; }

    // Depressions and major lakes
    std::vector<uint8_t>& lakeMask() { return lakes_; }
    const std::vector<uint8_t>& lakeMask() const { return lakes_; }

    // Accumulation-based lakes only; hydration measures lake distance to these
    std::vector<uint8_t>& majorLakeMask() { return majorLakes_; }
    const std::vector<uint8_t>& majorLakeMask() const { return majorLakes_; }

    bool isValid(int x, int y) const {
        return x >= 0 && x < width_ && y >= 0 && y < height_;
    }

private:
    int width_;
    int height_;

    std::vector<float> elevation_;   // Normalized [0, 1]
    std::vector<float> filled_;
    std::vector<float> accumulation_;
    std::vector<int> flowDir_;
    std::vector<uint8_t> ridges_;
    std::vector<uint8_t> rivers_;
    std::vector<uint8_t> lakes_;
    std::vector<uint8_t> majorLakes_;
};

} // namespace terrain
