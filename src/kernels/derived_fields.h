#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>
#include "../field/field_registry.h"
#include "../grid/grid_tensor.h"

namespace kernels {

/**
 * @brief Pure recomputation of derived fields.
 *
 * value = clamp(base + sum(linear: rate*src, inverse: rate*(1-src)) + ridgeWeight*ridge, lo, hi)
 *
 * Reads only non-derived fields of the same tensor and the static ridge
 * mask, so the result never depends on the previous value of the field.
 */
class DerivedFields {
public:
    // Single cell, single field. ridge is 0 or 1.
    static float evaluate(const field::FieldSpec& spec, const grid::GridTensor& tensor,
                          size_t cell, float ridge);

    // Overwrites every derived field in place. ridgeMask may be empty (no ridges).
    static void recompute(grid::GridTensor& tensor, const field::FieldRegistry& registry,
                          const std::vector<uint8_t>& ridgeMask);
};

} // namespace kernels
