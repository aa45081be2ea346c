#include "radius.h"
#include <cmath>

namespace fastblur {

static std::string describe_sigma(double sigma) {
  if (std::isnan(sigma)) return "NaN";
  if (std::isinf(sigma)) return sigma > 0 ? "+inf" : "-inf";
  return std::to_string(sigma);
}

InvalidRadius::InvalidRadius(double sigma)
  : std::invalid_argument("invalid blur radius " + describe_sigma(sigma) +
                          " (must be finite and >= 0)"),
    sigma_(sigma) {}

Radius::Radius(double sigma) : sigma_(sigma) {
  if (!isValid(sigma)) throw InvalidRadius(sigma);
}

std::optional<Radius> Radius::create(double sigma) noexcept {
  if (!isValid(sigma)) return std::nullopt;
  return Radius(sigma, UncheckedTag{});
}

Radius Radius::unchecked(double sigma) noexcept {
  return Radius(sigma, UncheckedTag{});
}

bool Radius::isValid(double sigma) noexcept {
  // NaN fails the comparison as well
  return std::isfinite(sigma) && sigma >= 0.0;
}

} // namespace fastblur
