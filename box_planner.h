#pragma once
#include <array>
#include <cstddef>
#include "radius.h"

namespace fastblur {

// Number of successive box filters used to approximate one Gaussian.
constexpr std::size_t kBoxPassCount = 3;

// Upper bound on a planned half-width; keeps 2r+1 and the running sums in range
// for any finite sigma.
constexpr int kMaxHalfWidth = 1 << 29;

struct BoxFilterSpec {
  int half_width = 0; // window is 2*half_width + 1 samples

  int window() const { return 2 * half_width + 1; }
};

inline bool operator==(const BoxFilterSpec& a, const BoxFilterSpec& b) {
  return a.half_width == b.half_width;
}
inline bool operator!=(const BoxFilterSpec& a, const BoxFilterSpec& b) {
  return !(a == b);
}

using BoxSpecSequence = std::array<BoxFilterSpec, kBoxPassCount>;

// Box half-widths whose successive application approximates a Gaussian of the
// given standard deviation ("Fast Almost-Gaussian Filtering", Kovesi / Kutskir).
// Narrow boxes come first.
BoxSpecSequence plan_box_blur(const Radius& radius);

// Validates sigma first. Throws InvalidRadius.
BoxSpecSequence plan_box_blur(double sigma);

} // namespace fastblur
