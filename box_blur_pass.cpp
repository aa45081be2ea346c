#include "box_blur_pass.h"
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <vector>

#ifndef FB_OMP
#  ifdef _OPENMP
#    include <omp.h>
#    define FB_OMP 1
#  else
#    define FB_OMP 0
#  endif
#endif

namespace fastblur {

namespace {

// Columns handled per task in the vertical fast pass
constexpr int kColumnBlock = 256;

inline uint8_t rounded_average(int64_t sum, int64_t window) {
  return static_cast<uint8_t>((2 * sum + window) / (2 * window));
}

// Sum of the clamped window centred on sample 0 of a line, in O(min(r, L)).
template <typename Sample>
inline int64_t initial_window_sum(const Sample& at, std::ptrdiff_t len, std::ptrdiff_t r) {
  const std::ptrdiff_t inside = std::min(r, len - 1);
  int64_t sum = static_cast<int64_t>(r + 1) * at(0);
  for (std::ptrdiff_t j = 1; j <= inside; ++j) sum += at(j);
  sum += static_cast<int64_t>(r - inside) * at(len - 1);
  return sum;
}

// ---------------- Reference ----------------

void reference_line(const uint8_t* src, uint8_t* dst, std::ptrdiff_t len,
                    std::ptrdiff_t r, std::ptrdiff_t step) {
  auto sample = [&](std::ptrdiff_t i) -> int64_t {
    return src[std::clamp<std::ptrdiff_t>(i, 0, len - 1) * step];
  };
  const int64_t window = 2 * r + 1;
  int64_t sum = initial_window_sum(sample, len, r);

  for (std::ptrdiff_t i = 0; i < len; ++i) {
    dst[i * step] = rounded_average(sum, window);
    sum += sample(i + r + 1) - sample(i - r);
  }
}

void reference_pass(const Plane& src, Plane& dst, BlurAxis axis, std::ptrdiff_t r, bool parallel) {
  const int lines = (axis == BlurAxis::Horizontal) ? src.height : src.width;
  const std::ptrdiff_t len = (axis == BlurAxis::Horizontal) ? src.width : src.height;
  const std::ptrdiff_t step = (axis == BlurAxis::Horizontal) ? 1 : src.width;
  (void)parallel;

#if FB_OMP
#pragma omp parallel for schedule(static) if(parallel)
#endif
  for (int i = 0; i < lines; ++i) {
    const std::size_t start = (axis == BlurAxis::Horizontal)
                                ? static_cast<std::size_t>(i) * static_cast<std::size_t>(src.width)
                                : static_cast<std::size_t>(i);
    reference_line(src.data.data() + start, dst.data.data() + start, len, r, step);
  }
}

// ---------------- Fast ----------------

// Contiguous line. The window edges cross the line ends at two fixed indices, so
// the line splits into at most three segments with no per-sample clamping.
void fast_row(const uint8_t* in, uint8_t* out, std::ptrdiff_t len, std::ptrdiff_t r) {
  const int64_t window = 2 * r + 1;
  const int64_t first = in[0];
  const int64_t last = in[len - 1];
  int64_t sum = initial_window_sum([in](std::ptrdiff_t j) -> int64_t { return in[j]; }, len, r);

  // in[i + r + 1] exists for i < enterEnd; in[i - r] exists for i >= leaveStart
  const std::ptrdiff_t enterEnd = std::clamp<std::ptrdiff_t>(len - r - 1, 0, len);
  const std::ptrdiff_t leaveStart = std::min(r, len);
  const std::ptrdiff_t p = std::min(enterEnd, leaveStart);
  const std::ptrdiff_t q = std::max(enterEnd, leaveStart);

  std::ptrdiff_t i = 0;
  for (; i < p; ++i) {
    out[i] = rounded_average(sum, window);
    sum += in[i + r + 1] - first;
  }
  if (enterEnd <= leaveStart) {
    // window wider than the line: both ends clamped
    for (; i < q; ++i) {
      out[i] = rounded_average(sum, window);
      sum += last - first;
    }
  } else {
    for (; i < q; ++i) {
      out[i] = rounded_average(sum, window);
      sum += static_cast<int64_t>(in[i + r + 1]) - in[i - r];
    }
  }
  for (; i < len; ++i) {
    out[i] = rounded_average(sum, window);
    sum += last - in[i - r];
  }
}

void fast_horizontal(const Plane& src, Plane& dst, std::ptrdiff_t r, bool parallel) {
  const int height = src.height;
  (void)parallel;

#if FB_OMP
#pragma omp parallel for schedule(static) if(parallel)
#endif
  for (int y = 0; y < height; ++y) {
    fast_row(src.row(y), dst.row(y), src.width, r);
  }
}

// One running sum per column; each step slides whole rows, so edge clamping
// happens on the row index only and the column loop is contiguous.
void fast_column_block(const Plane& src, Plane& dst, std::ptrdiff_t r, int x0, int x1,
                       int64_t* sums) {
  const std::ptrdiff_t h = src.height;
  const int64_t window = 2 * r + 1;
  const int n = x1 - x0;

  {
    const std::ptrdiff_t inside = std::min(r, h - 1);
    const uint8_t* top = src.row(0) + x0;
    const uint8_t* bottom = src.row(static_cast<int>(h - 1)) + x0;
    for (int x = 0; x < n; ++x) {
      sums[x] = static_cast<int64_t>(r + 1) * top[x] + static_cast<int64_t>(r - inside) * bottom[x];
    }
    for (std::ptrdiff_t j = 1; j <= inside; ++j) {
      const uint8_t* s = src.row(static_cast<int>(j)) + x0;
      for (int x = 0; x < n; ++x) sums[x] += s[x];
    }
  }

  for (std::ptrdiff_t y = 0; y < h; ++y) {
    uint8_t* out = dst.row(static_cast<int>(y)) + x0;
    for (int x = 0; x < n; ++x) out[x] = rounded_average(sums[x], window);

    const std::ptrdiff_t yEnter = (y < h - r - 1) ? y + r + 1 : h - 1;
    const std::ptrdiff_t yLeave = (y >= r) ? y - r : 0;
    const uint8_t* enter = src.row(static_cast<int>(yEnter)) + x0;
    const uint8_t* leave = src.row(static_cast<int>(yLeave)) + x0;
    for (int x = 0; x < n; ++x) sums[x] += static_cast<int64_t>(enter[x]) - leave[x];
  }
}

void fast_vertical(const Plane& src, Plane& dst, std::ptrdiff_t r, bool parallel) {
  const int width = src.width;
  const int blocks = (width + kColumnBlock - 1) / kColumnBlock;
  std::vector<int64_t> sums(static_cast<std::size_t>(width));
  (void)parallel;

#if FB_OMP
#pragma omp parallel for schedule(static) if(parallel)
#endif
  for (int b = 0; b < blocks; ++b) {
    const int x0 = b * kColumnBlock;
    const int x1 = std::min(width, x0 + kColumnBlock);
    fast_column_block(src, dst, r, x0, x1, sums.data() + x0);
  }
}

} // namespace

void box_blur_pass(const Plane& src, Plane& dst, BlurAxis axis, int half_width,
                   const PassOptions& opts) {
  const std::ptrdiff_t r = std::max(half_width, 0);

  if (opts.path == BoxBlurPath::Reference) {
    reference_pass(src, dst, axis, r, opts.parallel_lines);
    return;
  }

  if (r == 0) {
    std::copy(src.data.begin(), src.data.end(), dst.data.begin());
    return;
  }
  if (axis == BlurAxis::Horizontal) {
    fast_horizontal(src, dst, r, opts.parallel_lines);
  } else {
    fast_vertical(src, dst, r, opts.parallel_lines);
  }
}

} // namespace fastblur
