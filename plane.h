#pragma once
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace fastblur {

// One channel's samples, row-major, tightly packed (stride == width).
struct Plane {
  int width = 0;
  int height = 0;
  std::vector<uint8_t> data;

  Plane() = default;
  Plane(int w, int h) : width(w), height(h), data(static_cast<std::size_t>(w) * static_cast<std::size_t>(h)) {}

  std::size_t size() const { return data.size(); }

  uint8_t* row(int y) { return data.data() + static_cast<std::size_t>(y) * static_cast<std::size_t>(width); }
  const uint8_t* row(int y) const { return data.data() + static_cast<std::size_t>(y) * static_cast<std::size_t>(width); }

  uint8_t& at(int x, int y) { return row(y)[x]; }
  uint8_t at(int x, int y) const { return row(y)[x]; }
};

// Ping-pong between a channel's working plane and a scratch plane of the same
// size. Each pass reads current() and writes scratch(), then the roles swap.
class PlanePair {
public:
  PlanePair(Plane& working, Plane& scratch) : current_(&working), scratch_(&scratch) {}

  Plane& current() { return *current_; }
  Plane& scratch() { return *scratch_; }

  void swapRoles() { std::swap(current_, scratch_); }

private:
  Plane* current_;
  Plane* scratch_;
};

} // namespace fastblur
