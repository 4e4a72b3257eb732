#pragma once

#include <string>
#include <vector>
#include "../seed/seed_stream.h"

namespace climate {

    enum class HotEdge {
        North,   // Row 0 hottest
        South,   // Last row hottest
        Equator  // Middle row hottest, both edges cold
    };

    // Accepts "north", "south", "equator" and the "<edge>_hot" spellings.
    bool parseHotEdge(const std::string& text, HotEdge& out);
    const char* hotEdgeName(HotEdge edge);

    // "heat_profile" in the scenario
    struct HeatProfile {
        HotEdge direction = HotEdge::North;
        float amplitude = 0.6f;   // Edge-to-edge swing of the base gradient
        float noiseAmp = 0.05f;   // Additive noise lies in [-noiseAmp, noiseAmp]
        float noiseScale = 8.0f;  // Cells per noise period
    };

    class TemperatureField {
    public:
        // Base gradient (no noise) at a row; pure function of the profile.
        static float baseProfile(int row, int height, const HeatProfile& profile);

        // Tick-0 temperature raster (row-major), clipped to [0, 1].
        // Consumes only the given stream.
        static std::vector<float> generate(int width, int height, const HeatProfile& profile,
                                           seed::SeedStream stream);
    };

} // namespace climate
