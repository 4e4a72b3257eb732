#include "kernel_engine.h"
#include "derived_fields.h"
#include "../vegetation/vegetation_system.h"
#include "../core/errors.h"
#include <algorithm>
#include <cmath>
#include <utility>

namespace kernels {

KernelEngine::KernelEngine(field::FieldRegistry registry, KernelSettings settings,
                           std::vector<uint8_t> ridgeMask, seed::SeedStream noiseStream)
    : registry_(std::move(registry)),
      settings_(settings),
      ridgeMask_(std::move(ridgeMask)),
      noise_(noiseStream) {
}

grid::GridTensor KernelEngine::step(const grid::GridTensor& previous) {
    if (previous.fields() != registry_.size()) {
        throw core::StateError("tensor has " + std::to_string(previous.fields()) +
                               " fields, registry declares " + std::to_string(registry_.size()));
    }

    grid::GridTensor next = previous;
    if (settings_.diffusion) next = diffuse(next);
    if (settings_.advection) next = advectFields(next);
    if (settings_.coupling) next = couple(next);
    clip(next);
    recomputeDerived(next);
    return next;
}

grid::GridTensor KernelEngine::diffuse(const grid::GridTensor& in) const {
    grid::GridTensor out = in;
    const int w = in.width();
    const int h = in.height();

    for (const auto& spec : registry_.specs()) {
        if (spec.derived || spec.diffusion == 0.0f) continue;

        const std::vector<float> layer = in.fieldSlice(spec.index);
        const std::vector<float> lap = laplacian5(layer, w, h, settings_.boundary);
        std::vector<float> next(layer.size());
        for (size_t k = 0; k < layer.size(); ++k) {
            next[k] = layer[k] + spec.diffusion * lap[k];
        }
        out.setFieldSlice(spec.index, next);
    }
    return out;
}

grid::GridTensor KernelEngine::advectFields(const grid::GridTensor& in) const {
    grid::GridTensor out = in;
    for (const auto& spec : registry_.specs()) {
        if (spec.derived || !spec.hasAdvection()) continue;
        out.setFieldSlice(spec.index, advect(in.fieldSlice(spec.index), in.width(), in.height(),
                                             spec.advection.vx, spec.advection.vy, settings_.boundary));
    }
    return out;
}

float KernelEngine::growthAt(const field::FieldSpec& spec, const grid::GridTensor& in, size_t cell) {
    if (spec.growthRate == 0.0f) return 0.0f;

    float suitability = 1.0f;
    for (const auto& c : spec.couplings) {
        float src = in.atCell(cell, c.sourceIndex);
        if (c.kind == field::CouplingKind::WaterLimit) {
            suitability *= vegetation::VegetationSystem::waterFactor(src, c.half);
        } else if (c.kind == field::CouplingKind::HeatLimit) {
            suitability *= vegetation::VegetationSystem::heatFactor(src, c.optimum, c.sigma);
        }
    }
    return vegetation::VegetationSystem::logisticGrowth(in.atCell(cell, spec.index),
                                                        spec.growthRate, spec.capacity, suitability);
}

grid::GridTensor KernelEngine::couple(const grid::GridTensor& in) {
    const int fields = registry_.size();
    const size_t cells = in.cellCount();

    // Sequential draws: field index order, then row-major cells
    std::vector<std::vector<float>> jitter(static_cast<size_t>(fields));
    for (const auto& spec : registry_.specs()) {
        if (spec.derived || spec.noise == 0.0f) continue;
        auto& layer = jitter[static_cast<size_t>(spec.index)];
        layer.resize(cells);
        for (size_t k = 0; k < cells; ++k) {
            layer[k] = noise_.uniform(-1.0f, 1.0f) * spec.noise;
        }
    }

    grid::GridTensor out = in;
    const int count = static_cast<int>(cells);

    #pragma omp parallel for
    for (int i = 0; i < count; ++i) {
        const size_t cell = static_cast<size_t>(i);
        for (const auto& spec : registry_.specs()) {
            if (spec.derived) continue;

            float v = in.atCell(cell, spec.index);
            v += growthAt(spec, in, cell);

            for (const auto& c : spec.couplings) {
                if (c.kind == field::CouplingKind::Evaporation) {
                    v -= c.rate * std::clamp(in.atCell(cell, c.sourceIndex), 0.0f, 1.0f);
                } else if (c.kind == field::CouplingKind::Consumption) {
                    v -= c.rate * growthAt(registry_.at(c.sourceIndex), in, cell);
                }
            }

            if (spec.decay != 0.0f) v *= (1.0f - spec.decay);
            if (spec.replenish != 0.0f) v += spec.replenish;

            const auto& layer = jitter[static_cast<size_t>(spec.index)];
            if (!layer.empty()) v += layer[cell];

            out.atCell(cell, spec.index) = v;
        }
    }
    return out;
}

float KernelEngine::clipValue(float v, float lo, float hi) {
    if (std::isnan(v)) return lo;
    return std::clamp(v, lo, hi);
}

void KernelEngine::clip(grid::GridTensor& tensor) const {
    const int count = static_cast<int>(tensor.cellCount());
    for (const auto& spec : registry_.specs()) {
        if (spec.derived) continue;

        #pragma omp parallel for
        for (int i = 0; i < count; ++i) {
            float& v = tensor.atCell(static_cast<size_t>(i), spec.index);
            v = clipValue(v, spec.lo, spec.hi);
        }
    }
}

void KernelEngine::recomputeDerived(grid::GridTensor& tensor) const {
    DerivedFields::recompute(tensor, registry_, ridgeMask_);
}

} // namespace kernels
