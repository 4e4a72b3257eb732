#pragma once

#include "field_spec.h"
#include <cstddef>
#include <string>
#include <vector>

namespace field {

/**
 * @brief Dense, index-addressed table of FieldSpec.
 *
 * Name lookups happen once at setup; everything downstream addresses
 * fields by their integer index.
 */
class FieldRegistry {
public:
    FieldRegistry() = default;

    // Validates and freezes the declared fields. Throws core::ConfigError on
    // duplicate names, derived fields with dynamics, or unresolvable couplings.
    static FieldRegistry build(const std::vector<FieldSpec>& declared);

    int size() const { return static_cast<int>(specs_.size()); }
    const FieldSpec& at(int index) const { return specs_.at(static_cast<size_t>(index)); }
    const std::vector<FieldSpec>& specs() const { return specs_; }

    // -1 when absent
    int indexOf(const std::string& name) const;
    // Throws core::NotFoundError when absent
    int require(const std::string& name) const;

    std::vector<std::string> names() const;

private:
    std::vector<FieldSpec> specs_;
};

// Range checks on dynamics coefficients. Throws core::ConfigError.
void validateCoefficientRanges(const FieldRegistry& registry);

} // namespace field
