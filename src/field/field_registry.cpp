#include "field_registry.h"
#include "../core/errors.h"
#include <cmath>
#include <map>

namespace field {

const char* couplingKindName(CouplingKind kind) {
    switch (kind) {
    case CouplingKind::Evaporation: return "evaporation";
    case CouplingKind::Consumption: return "consumption";
    case CouplingKind::WaterLimit:  return "water_limit";
    case CouplingKind::HeatLimit:   return "heat_limit";
    case CouplingKind::Linear:      return "linear";
    case CouplingKind::Inverse:     return "inverse";
    }
    return "unknown";
}

bool parseCouplingKind(const std::string& name, CouplingKind& out) {
    static const std::map<std::string, CouplingKind> kinds = {
        {"evaporation", CouplingKind::Evaporation},
        {"consumption", CouplingKind::Consumption},
        {"water_limit", CouplingKind::WaterLimit},
        {"heat_limit",  CouplingKind::HeatLimit},
        {"linear",      CouplingKind::Linear},
        {"inverse",     CouplingKind::Inverse}
    };
    auto it = kinds.find(name);
    if (it == kinds.end()) return false;
    out = it->second;
    return true;
}

bool isDerivedKind(CouplingKind kind) {
    return kind == CouplingKind::Linear || kind == CouplingKind::Inverse;
}

FieldRegistry FieldRegistry::build(const std::vector<FieldSpec>& declared) {
    if (declared.empty()) {
        throw core::ConfigError("field list is empty");
    }

    FieldRegistry registry;
    registry.specs_ = declared;

    std::map<std::string, int> byName;
    for (size_t i = 0; i < registry.specs_.size(); ++i) {
        FieldSpec& spec = registry.specs_[i];
        spec.index = static_cast<int>(i);

        if (spec.name.empty()) {
            throw core::ConfigError("field #" + std::to_string(i) + " has no name");
        }
        if (!byName.emplace(spec.name, spec.index).second) {
            throw core::ConfigError("duplicate field name '" + spec.name + "'");
        }
        if (!std::isfinite(spec.lo) || !std::isfinite(spec.hi) || !(spec.lo < spec.hi)) {
            throw core::ConfigError("field '" + spec.name + "' has invalid bounds");
        }
        if (spec.derived) {
            // Derived fields are recomputed every tick, never evolved.
            if (spec.diffusion != 0.0f) {
                throw core::ConfigError("derived field '" + spec.name + "' declares a diffusion coefficient");
            }
            if (spec.advection.enabled) {
                throw core::ConfigError("derived field '" + spec.name + "' declares advection");
            }
        }
    }

    const int count = registry.size();
    for (FieldSpec& spec : registry.specs_) {
        for (Coupling& c : spec.couplings) {
            if (!c.sourceName.empty()) {
                auto it = byName.find(c.sourceName);
                if (it == byName.end()) {
                    throw core::ConfigError("field '" + spec.name + "' couples to unknown field '" + c.sourceName + "'");
                }
                c.sourceIndex = it->second;
            }
            if (c.sourceIndex < 0 || c.sourceIndex >= count) {
                throw core::ConfigError("field '" + spec.name + "' couples to non-existent field index " +
                                        std::to_string(c.sourceIndex));
            }
            c.sourceName = registry.specs_[static_cast<size_t>(c.sourceIndex)].name;

            if (isDerivedKind(c.kind) != spec.derived) {
                throw core::ConfigError(std::string("coupling kind '") + couplingKindName(c.kind) +
                                        "' is not valid on field '" + spec.name + "'");
            }
            if (registry.specs_[static_cast<size_t>(c.sourceIndex)].derived) {
                throw core::ConfigError("field '" + spec.name + "' couples to derived field '" + c.sourceName + "'");
            }
        }
    }

    return registry;
}

int FieldRegistry::indexOf(const std::string& name) const {
    for (const auto& spec : specs_) {
        if (spec.name == name) return spec.index;
    }
    return -1;
}

int FieldRegistry::require(const std::string& name) const {
    int idx = indexOf(name);
    if (idx < 0) {
        throw core::NotFoundError("field '" + name + "' not found");
    }
    return idx;
}

std::vector<std::string> FieldRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(specs_.size());
    for (const auto& spec : specs_) out.push_back(spec.name);
    return out;
}

void validateCoefficientRanges(const FieldRegistry& registry) {
    for (const auto& spec : registry.specs()) {
        const std::string& n = spec.name;
        // Explicit 5-point stencil is unstable above 0.25.
        if (!(spec.diffusion >= 0.0f && spec.diffusion <= 0.25f)) {
            throw core::ConfigError("field '" + n + "': diffusion must be in [0, 0.25]");
        }
        if (!(spec.decay >= 0.0f && spec.decay <= 1.0f)) {
            throw core::ConfigError("field '" + n + "': decay must be in [0, 1]");
        }
        if (!(spec.replenish >= 0.0f) || !(spec.noise >= 0.0f) || !(spec.growthRate >= 0.0f)) {
            throw core::ConfigError("field '" + n + "': replenish, noise and growth rate must be >= 0");
        }
        if (spec.growthRate > 0.0f && !(spec.capacity > 0.0f)) {
            throw core::ConfigError("field '" + n + "': growth capacity must be > 0");
        }
        if (!std::isfinite(spec.advection.vx) || !std::isfinite(spec.advection.vy)) {
            throw core::ConfigError("field '" + n + "': advection velocity must be finite");
        }
        for (const auto& c : spec.couplings) {
            if (!(c.rate >= 0.0f)) {
                throw core::ConfigError("field '" + n + "': coupling rate must be >= 0");
            }
            if (c.kind == CouplingKind::WaterLimit && !(c.half > 0.0f)) {
                throw core::ConfigError("field '" + n + "': water_limit half must be > 0");
            }
            if (c.kind == CouplingKind::HeatLimit && !(c.sigma > 0.0f)) {
                throw core::ConfigError("field '" + n + "': heat_limit sigma must be > 0");
            }
        }
    }
}

} // namespace field
