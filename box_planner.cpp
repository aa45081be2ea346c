#include "box_planner.h"
#include <algorithm>
#include <cmath>

namespace fastblur {

static int saturate_width(double w) {
  const double cap = 2.0 * kMaxHalfWidth + 1.0;
  return static_cast<int>(std::min(w, cap));
}

BoxSpecSequence plan_box_blur(const Radius& radius) {
  const double n = static_cast<double>(kBoxPassCount);
  const double var12 = 12.0 * radius.sigma() * radius.sigma();

  const double wIdeal = std::sqrt(var12 / n + 1.0);
  int wl = saturate_width(std::floor(wIdeal));
  wl -= ((wl & 1) == 0); // box widths must be odd
  const int wu = std::min(wl + 2, 2 * kMaxHalfWidth + 1);

  const double wlf = static_cast<double>(wl);
  const double mIdeal = (var12 - n * wlf * wlf - 4.0 * n * wlf - 3.0 * n) / (-4.0 * wlf - 4.0);
  const double mClamped = std::clamp(std::round(mIdeal), 0.0, n);
  const std::size_t m = static_cast<std::size_t>(mClamped);

  BoxSpecSequence specs;
  for (std::size_t i = 0; i < kBoxPassCount; ++i) {
    const int w = (i < m) ? wl : wu;
    specs[i].half_width = (w - 1) / 2;
  }
  return specs;
}

BoxSpecSequence plan_box_blur(double sigma) {
  return plan_box_blur(Radius(sigma));
}

} // namespace fastblur
