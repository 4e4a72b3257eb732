#pragma once

#include <vector>

namespace kernels {

// Boundary handling per axis: periodic wrap or clamp-to-edge.
struct Boundary {
    bool wrapX = true;
    bool wrapY = true;
};

// 5-point discrete Laplacian of a row-major (height x width) layer.
std::vector<float> laplacian5(const std::vector<float>& layer, int width, int height, Boundary boundary);

// Semi-Lagrangian advection: each cell samples the layer at (x - vx, y - vy)
// with bilinear interpolation.
std::vector<float> advect(const std::vector<float>& layer, int width, int height,
                          float vx, float vy, Boundary boundary);

} // namespace kernels
