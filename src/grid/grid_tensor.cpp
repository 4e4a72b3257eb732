#include "grid_tensor.h"
#include <cmath>
#include <cstring>
#include <stdexcept>

namespace grid {

GridTensor::GridTensor(int height, int width, int fields, float fill)
    : height_(height), width_(width), fields_(fields) {
    if (height < 0 || width < 0 || fields < 0) {
        throw std::invalid_argument("GridTensor dimensions must be non-negative");
    }
    data_.assign(static_cast<size_t>(height) * static_cast<size_t>(width) * static_cast<size_t>(fields), fill);
}

std::vector<float> GridTensor::fieldSlice(int field) const {
    std::vector<float> out(cellCount());
    for (size_t i = 0; i < out.size(); ++i) {
        out[i] = atCell(i, field);
    }
    return out;
}

void GridTensor::setFieldSlice(int field, const std::vector<float>& values) {
    if (values.size() != cellCount()) {
        throw std::invalid_argument("field slice size does not match grid");
    }
    for (size_t i = 0; i < values.size(); ++i) {
        atCell(i, field) = values[i];
    }
}

bool GridTensor::bitIdentical(const GridTensor& other) const {
    if (!sameShape(other)) return false;
    if (data_.empty()) return true;
    return std::memcmp(data_.data(), other.data_.data(), data_.size() * sizeof(float)) == 0;
}

bool GridTensor::allFinite() const {
    for (float v : data_) {
        if (!std::isfinite(v)) return false;
    }
    return true;
}

uint32_t floatBits(float value) {
    uint32_t bits = 0;
    static_assert(sizeof(bits) == sizeof(value), "float must be 32-bit");
    std::memcpy(&bits, &value, sizeof(bits));
    return bits;
}

float floatFromBits(uint32_t bits) {
    float value = 0.0f;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

} // namespace grid
