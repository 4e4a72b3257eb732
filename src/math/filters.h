#pragma once

#include <cstdint>
#include <vector>

namespace math {

// Separable Gaussian blur on a row-major (height x width) raster.
// Out-of-range taps wrap when the axis wraps, otherwise clamp to the edge.
void gaussianBlur(std::vector<float>& data, int width, int height, float sigma, bool wrapX, bool wrapY);

// Exact Euclidean distance (in cells) from each cell to the nearest set cell
// of the mask. All entries are +inf when the mask is empty.
std::vector<float> distanceTransform(const std::vector<uint8_t>& mask, int width, int height);

// Linear-interpolated quantile, q in [0, 1] (numpy "linear" method).
float quantile(std::vector<float> values, float q);

// Rescale to [0, 1]; a constant raster maps to 0.
void normalize01(std::vector<float>& data);

} // namespace math
