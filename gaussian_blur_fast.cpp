#include "gaussian_blur_fast.h"
#include <algorithm>
#include "plane.h"
#include "thread_pool.h"

namespace fastblur {

SeparableBlurEngine::SeparableBlurEngine(const BlurOptions& opts) : opts_(opts) {
  const std::size_t n = opts_.threads ? opts_.threads : ThreadPool::hardware_threads();
  if (n > 1) pool_ = std::make_unique<ThreadPool>(n);
}

SeparableBlurEngine::~SeparableBlurEngine() = default;

std::size_t SeparableBlurEngine::threads() const {
  return pool_ ? pool_->size() : 1;
}

void SeparableBlurEngine::blur(ImageView image, double sigma) {
  blur(image, Radius(sigma));
}

void SeparableBlurEngine::blur(ImageView image, const Radius& radius) {
  const BoxSpecSequence specs = plan_box_blur(radius);

  // Every pass would be a copy
  const bool identity = std::all_of(specs.begin(), specs.end(),
                                    [](const BoxFilterSpec& s) { return s.half_width == 0; });
  if (identity) return;

  const int channels = image.channels();
  if (!pool_ || channels == 1) {
    blurChannels_(image, specs, 0, channels, opts_.parallel_lines);
    return;
  }

  // Contiguous channel chunks, one pair of planes per chunk
  const std::size_t workers = pool_->size();
  const std::size_t block = (static_cast<std::size_t>(channels) + workers - 1) / workers;
  pool_->parallel_for(0, static_cast<std::size_t>(channels), block,
                      [this, &image, &specs](std::size_t c0, std::size_t c1) {
                        blurChannels_(image, specs, static_cast<int>(c0), static_cast<int>(c1), false);
                      });
}

void SeparableBlurEngine::blurChannels_(ImageView& image, const BoxSpecSequence& specs,
                                        int c0, int c1, bool parallelLines) const {
  Plane working(image.width(), image.height());
  Plane scratch(image.width(), image.height());

  PassOptions pass;
  pass.path = opts_.path;
  pass.parallel_lines = parallelLines;

  for (int c = c0; c < c1; ++c) {
    image.extractPlane(c, working);
    PlanePair planes(working, scratch);

    for (const BoxFilterSpec& spec : specs) {
      box_blur_pass(planes.current(), planes.scratch(), BlurAxis::Horizontal, spec.half_width, pass);
      planes.swapRoles();
      box_blur_pass(planes.current(), planes.scratch(), BlurAxis::Vertical, spec.half_width, pass);
      planes.swapRoles();
    }

    image.storePlane(c, planes.current());
  }
}

void gaussian_blur(ImageView image, const Radius& radius) {
  SeparableBlurEngine engine;
  engine.blur(image, radius);
}

void gaussian_blur(ImageView image, double sigma) {
  // validate before building anything
  const Radius radius(sigma);
  gaussian_blur(image, radius);
}

} // namespace fastblur
