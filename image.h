#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>
#include "plane.h"

namespace fastblur {

// Non-owning view of an 8-bit image: row-major, channels interleaved per pixel,
// stride == width * channels. The caller keeps the buffer alive and unshared
// while the view is in use.
class ImageView {
public:
  // Throws std::invalid_argument for a null buffer or a dimension < 1.
  ImageView(uint8_t* pixels, int width, int height, int channels);

  int width() const { return w_; }
  int height() const { return h_; }
  int channels() const { return c_; }

  uint8_t* data() { return px_; }
  const uint8_t* data() const { return px_; }
  std::size_t sizeBytes() const {
    return static_cast<std::size_t>(w_) * static_cast<std::size_t>(h_) * static_cast<std::size_t>(c_);
  }

  // Copies channel c into plane, which must be width x height.
  void extractPlane(int c, Plane& plane) const;
  // Writes plane back into channel c.
  void storePlane(int c, const Plane& plane);

private:
  uint8_t* px_;
  int w_;
  int h_;
  int c_;
};

// Owning image, as produced by the loaders in image_io.h.
struct Image {
  int width = 0;
  int height = 0;
  int channels = 0;
  std::vector<uint8_t> pixels; // size = width * height * channels

  Image() = default;
  Image(int w, int h, int c, uint8_t fill = 0);

  bool empty() const { return pixels.empty(); }

  uint8_t& at(int x, int y, int c) {
    return pixels[(static_cast<std::size_t>(y) * static_cast<std::size_t>(width) + static_cast<std::size_t>(x)) *
                  static_cast<std::size_t>(channels) + static_cast<std::size_t>(c)];
  }
  uint8_t at(int x, int y, int c) const {
    return pixels[(static_cast<std::size_t>(y) * static_cast<std::size_t>(width) + static_cast<std::size_t>(x)) *
                  static_cast<std::size_t>(channels) + static_cast<std::size_t>(c)];
  }

  // Throws std::invalid_argument if the image is empty or inconsistent.
  ImageView view();
};

} // namespace fastblur
