#include "hydro_system.h"
#include "../math/filters.h"
#include <algorithm>
#include <cmath>

namespace landscape {

    std::vector<float> HydroSystem::computeHydration(const terrain::TerrainMap& terrain,
                                                     const terrain::HydrologyProfile& profile,
                                                     bool wrapX, bool wrapY) {
        const int w = terrain.getWidth();
        const int h = terrain.getHeight();
        const size_t size = terrain.size();

        // Exact Euclidean distances; +inf when a class is absent (influence 0)
        const std::vector<float> riverDist = math::distanceTransform(terrain.riverMask(), w, h);
        const std::vector<float> lakeDist = math::distanceTransform(terrain.majorLakeMask(), w, h);
        const std::vector<float>& elev = terrain.elevation();

        const float base = profile.baseMoisture;
        std::vector<float> h2o(size, base);

        #pragma omp parallel for
        for (int i = 0; i < static_cast<int>(size); ++i) {
            const size_t k = static_cast<size_t>(i);
            float riverInfluence = std::exp(-riverDist[k] / profile.riverDecay);
            float lakeInfluence = std::exp(-lakeDist[k] / profile.lakeDecay);

            float v = base;
            v += riverInfluence * (profile.riverDepth - base);
            v += lakeInfluence * (profile.lakeDepth - base);
            // Lowlands hold more water
            v += (1.0f - elev[k]) * profile.lowlandBonus;
            h2o[k] = v;
        }

        math::gaussianBlur(h2o, w, h, profile.smoothingSigma, wrapX, wrapY);

        for (auto& v : h2o) {
            v = std::clamp(v, 0.0f, 1.0f);
        }
        return h2o;
    }

} // namespace landscape
