#include "derived_fields.h"
#include <algorithm>
#include <cmath>

namespace kernels {

float DerivedFields::evaluate(const field::FieldSpec& spec, const grid::GridTensor& tensor,
                              size_t cell, float ridge) {
    float v = spec.derivedBase;
    for (const auto& c : spec.couplings) {
        float src = tensor.atCell(cell, c.sourceIndex);
        if (c.kind == field::CouplingKind::Linear) {
            v += c.rate * src;
        } else if (c.kind == field::CouplingKind::Inverse) {
            v += c.rate * (1.0f - src);
        }
    }
    v += spec.ridgeWeight * ridge;

    if (std::isnan(v)) return spec.lo;
    return std::clamp(v, spec.lo, spec.hi);
}

void DerivedFields::recompute(grid::GridTensor& tensor, const field::FieldRegistry& registry,
                              const std::vector<uint8_t>& ridgeMask) {
    const int cells = static_cast<int>(tensor.cellCount());
    const bool hasRidges = ridgeMask.size() == tensor.cellCount();

    for (const auto& spec : registry.specs()) {
        if (!spec.derived) continue;

        #pragma omp parallel for
        for (int i = 0; i < cells; ++i) {
            const size_t cell = static_cast<size_t>(i);
            float ridge = (hasRidges && ridgeMask[cell]) ? 1.0f : 0.0f;
            tensor.atCell(cell, spec.index) = evaluate(spec, tensor, cell, ridge);
        }
    }
}

} // namespace kernels
