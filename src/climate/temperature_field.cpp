#include "temperature_field.h"
#include "../math/noise.h"
#include <algorithm>
#include <cmath>

namespace climate {

    namespace {
        constexpr float kPi = 3.14159265358979323846f;

        // 0 at d = 0, 1 at d = 1, flat at both ends
        inline float cosineRamp(float d) {
            return 0.5f * (1.0f - std::cos(kPi * d));
        }
    }

    bool parseHotEdge(const std::string& text, HotEdge& out) {
        if (text == "north" || text == "north_hot") { out = HotEdge::North; return true; }
        if (text == "south" || text == "south_hot") { out = HotEdge::South; return true; }
        if (text == "equator" || text == "equator_hot") { out = HotEdge::Equator; return true; }
        return false;
    }

    const char* hotEdgeName(HotEdge edge) {
        switch (edge) {
        case HotEdge::North:   return "north";
        case HotEdge::South:   return "south";
        case HotEdge::Equator: return "equator";
        }
        return "north";
    }

    float TemperatureField::baseProfile(int row, int height, const HeatProfile& profile) {
        float t = height > 1 ? static_cast<float>(row) / static_cast<float>(height - 1) : 0.0f;

        float s = 0.0f; // 0 = hottest, 1 = coldest
        switch (profile.direction) {
        case HotEdge::North:
            s = cosineRamp(t);
            break;
        case HotEdge::South:
            s = cosineRamp(1.0f - t);
            break;
        case HotEdge::Equator:
            s = cosineRamp(std::fabs(t - 0.5f) * 2.0f);
            break;
        }
        return 0.5f + profile.amplitude * (0.5f - s);
    }

    std::vector<float> TemperatureField::generate(int width, int height, const HeatProfile& profile,
                                                  seed::SeedStream stream) {
        math::NoiseField noise(stream);
        std::vector<float> temp = noise.raster(width, height, profile.noiseScale, 3, 0.5f, true);

        for (int y = 0; y < height; ++y) {
            const float base = baseProfile(y, height, profile);
            for (int x = 0; x < width; ++x) {
                float& t = temp[static_cast<size_t>(y * width + x)];
                t = std::clamp(base + t * profile.noiseAmp, 0.0f, 1.0f);
            }
        }
        return temp;
    }

} // namespace climate
