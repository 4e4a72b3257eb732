#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace grid {

/**
 * @brief Full environment state at one tick.
 *
 * Shape (height, width, fields), single precision, row-major with the field
 * axis innermost: index = (row * width + col) * fields + field.
 */
class GridTensor {
public:
    GridTensor() = default;
    GridTensor(int height, int width, int fields, float fill = 0.0f);

    int height() const { return height_; }
    int width() const { return width_; }
    int fields() const { return fields_; }
    size_t cellCount() const { return static_cast<size_t>(height_) * static_cast<size_t>(width_); }
    size_t size() const { return data_.size(); }
    bool empty() const { return data_.empty(); }

    size_t offset(int row, int col, int field) const {
        return (static_cast<size_t>(row) * static_cast<size_t>(width_) + static_cast<size_t>(col)) *
               static_cast<size_t>(fields_) + static_cast<size_t>(field);
    }

    float at(int row, int col, int field) const { return data_[offset(row, col, field)]; }
    float& at(int row, int col, int field) { return data_[offset(row, col, field)]; }

    // By flat cell index (row * width + col)
    float atCell(size_t cell, int field) const { return data_[cell * static_cast<size_t>(fields_) + static_cast<size_t>(field)]; }
    float& atCell(size_t cell, int field) { return data_[cell * static_cast<size_t>(fields_) + static_cast<size_t>(field)]; }

    bool inBounds(int row, int col) const {
        return row >= 0 && row < height_ && col >= 0 && col < width_;
    }

    std::vector<float>& data() { return data_; }
    const std::vector<float>& data() const { return data_; }

    // Copy of one field layer, row-major (height * width)
    std::vector<float> fieldSlice(int field) const;
    void setFieldSlice(int field, const std::vector<float>& values);

    bool sameShape(const GridTensor& other) const {
        return height_ == other.height_ && width_ == other.width_ && fields_ == other.fields_;
    }

    // Bit-pattern equality over every value (distinguishes -0.0 from 0.0).
    bool bitIdentical(const GridTensor& other) const;

    bool allFinite() const;

private:
    int height_ = 0;
    int width_ = 0;
    int fields_ = 0;
    std::vector<float> data_;
};

// Bit pattern of a float, used wherever "changed" means a different bit pattern.
uint32_t floatBits(float value);
float floatFromBits(uint32_t bits);

} // namespace grid
