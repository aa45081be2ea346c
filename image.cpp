#include "image.h"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace fastblur {

ImageView::ImageView(uint8_t* pixels, int width, int height, int channels)
  : px_(pixels), w_(width), h_(height), c_(channels) {
  if (!px_) throw std::invalid_argument("image buffer is null");
  if (w_ < 1 || h_ < 1 || c_ < 1) {
    throw std::invalid_argument("bad image dimensions " + std::to_string(w_) + "x" +
                                std::to_string(h_) + "x" + std::to_string(c_));
  }
}

void ImageView::extractPlane(int c, Plane& plane) const {
  const std::size_t n = static_cast<std::size_t>(w_) * static_cast<std::size_t>(h_);
  const std::size_t step = static_cast<std::size_t>(c_);
  const uint8_t* src = px_ + c;
  uint8_t* dst = plane.data.data();
  if (step == 1) {
    std::copy_n(src, n, dst);
    return;
  }
  for (std::size_t i = 0; i < n; ++i) dst[i] = src[i * step];
}

void ImageView::storePlane(int c, const Plane& plane) {
  const std::size_t n = static_cast<std::size_t>(w_) * static_cast<std::size_t>(h_);
  const std::size_t step = static_cast<std::size_t>(c_);
  const uint8_t* src = plane.data.data();
  uint8_t* dst = px_ + c;
  if (step == 1) {
    std::copy_n(src, n, dst);
    return;
  }
  for (std::size_t i = 0; i < n; ++i) dst[i * step] = src[i];
}

Image::Image(int w, int h, int c, uint8_t fill)
  : width(w), height(h), channels(c),
    pixels(static_cast<std::size_t>(w) * static_cast<std::size_t>(h) * static_cast<std::size_t>(c), fill) {}

ImageView Image::view() {
  const std::size_t expected =
      static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * static_cast<std::size_t>(channels);
  if (pixels.size() != expected) {
    throw std::invalid_argument("image buffer holds " + std::to_string(pixels.size()) +
                                " bytes, expected " + std::to_string(expected));
  }
  return ImageView(pixels.data(), width, height, channels);
}

} // namespace fastblur
