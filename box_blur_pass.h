#pragma once
#include "plane.h"

namespace fastblur {

enum class BlurAxis { Horizontal, Vertical };

// Reference clamps every sample index. Fast hoists the edge handling out of the
// inner loop; both produce identical bytes.
enum class BoxBlurPath { Fast, Reference };

struct PassOptions {
  BoxBlurPath path = BoxBlurPath::Fast;
  bool parallel_lines = true; // only has an effect when built with OpenMP
};

// One moving-average pass of width 2*half_width+1 along rows (Horizontal) or
// columns (Vertical). Out-of-range samples repeat the nearest edge sample and
// averages round to nearest, halves up. half_width == 0 copies src.
//
// src and dst must have the same dimensions and must be different planes.
void box_blur_pass(const Plane& src, Plane& dst, BlurAxis axis, int half_width,
                   const PassOptions& opts = PassOptions());

} // namespace fastblur
