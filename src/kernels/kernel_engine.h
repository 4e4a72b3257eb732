#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>
#include "stencils.h"
#include "../field/field_registry.h"
#include "../grid/grid_tensor.h"
#include "../seed/seed_stream.h"

namespace kernels {

struct KernelSettings {
    Boundary boundary;
    // Optional passes; clip and derived recomputation always run.
    bool diffusion = true;
    bool advection = true;
    bool coupling = true;
};

/**
 * @brief Advances the environment tensor by one tick.
 *
 * Pass order is fixed: diffusion -> advection -> coupling -> clip -> derived.
 * Each pass is a full-tensor transform of the previous pass's output; no pass
 * reads a cell it has already written in the same tick.
 *
 * Owns the "noise" seed stream. Noise is drawn sequentially before the
 * per-cell loop so the sequence does not depend on thread scheduling.
 */
class KernelEngine {
public:
    KernelEngine(field::FieldRegistry registry, KernelSettings settings,
                 std::vector<uint8_t> ridgeMask, seed::SeedStream noiseStream);

    grid::GridTensor step(const grid::GridTensor& previous);

    // Individual passes
    grid::GridTensor diffuse(const grid::GridTensor& in) const;
    grid::GridTensor advectFields(const grid::GridTensor& in) const;
    grid::GridTensor couple(const grid::GridTensor& in);
    void clip(grid::GridTensor& tensor) const;
    void recomputeDerived(grid::GridTensor& tensor) const;

    // Logistic growth of a field at one cell, including its water/heat limit factors.
    static float growthAt(const field::FieldSpec& spec, const grid::GridTensor& in, size_t cell);

    // NaN -> lo, infinities and out-of-range values -> nearest bound
    static float clipValue(float v, float lo, float hi);

    const field::FieldRegistry& registry() const { return registry_; }
    const KernelSettings& settings() const { return settings_; }

private:
    field::FieldRegistry registry_;
    KernelSettings settings_;
    std::vector<uint8_t> ridgeMask_;
    seed::SeedStream noise_;
};

} // namespace kernels
