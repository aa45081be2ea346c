#pragma once
#include <cstddef>
#include <memory>
#include "box_blur_pass.h"
#include "box_planner.h"
#include "image.h"
#include "radius.h"

namespace fastblur {

class ThreadPool;

struct BlurOptions {
  std::size_t threads = 1;   // channel workers; 0 = hardware concurrency
  BoxBlurPath path = BoxBlurPath::Fast;
  bool parallel_lines = true; // OpenMP over lines when channels run serially
};

// Approximate Gaussian blur as kBoxPassCount separable box blurs per channel.
// Cost is O(channels * width * height) whatever the radius.
class SeparableBlurEngine {
public:
  explicit SeparableBlurEngine(const BlurOptions& opts = BlurOptions());
  ~SeparableBlurEngine();

  SeparableBlurEngine(const SeparableBlurEngine&) = delete;
  SeparableBlurEngine& operator=(const SeparableBlurEngine&) = delete;

  const BlurOptions& options() const { return opts_; }
  std::size_t threads() const;

  // Blurs every channel of image in place.
  void blur(ImageView image, const Radius& radius);

  // Throws InvalidRadius before the image is touched.
  void blur(ImageView image, double sigma);

private:
  void blurChannels_(ImageView& image, const BoxSpecSequence& specs, int c0, int c1, bool parallelLines) const;

  BlurOptions opts_;
  std::unique_ptr<ThreadPool> pool_; // only when more than one worker
};

// Single-threaded convenience wrappers.
void gaussian_blur(ImageView image, const Radius& radius);
void gaussian_blur(ImageView image, double sigma);

} // namespace fastblur
