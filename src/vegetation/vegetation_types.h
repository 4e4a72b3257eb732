#pragma once

namespace vegetation {

    // "vegetation_profile" in the scenario. Drives the tick-0 layer and the
    // defaults of the growth couplings.
    struct VegetationProfile {
        float k = 0.08f;                 // Logistic growth rate
        float waterHalf = 0.35f;         // Half-saturation of the water term
        float heatOptimum = 0.65f;       // Temperature of peak suitability
        float heatSigma = 0.18f;         // Width of the Gaussian heat term
        float carryingCapacity = 1.0f;   // K
        float noiseAmp = 0.01f;          // Bounded patchiness in [-noiseAmp, noiseAmp]
        float noiseScale = 4.0f;         // Cells per noise period
    };

} // namespace vegetation
