#pragma once
#include <optional>
#include <stdexcept>
#include <string>

namespace fastblur {

// Thrown when a blur radius is negative, NaN or infinite.
class InvalidRadius : public std::invalid_argument {
public:
  explicit InvalidRadius(double sigma);

  double sigma() const { return sigma_; }

private:
  double sigma_;
};

// Standard deviation of the target Gaussian. Always finite and >= 0.
class Radius {
public:
  // Throws InvalidRadius.
  explicit Radius(double sigma);

  // Returns std::nullopt instead of throwing.
  static std::optional<Radius> create(double sigma) noexcept;

  // No validation. The caller must guarantee that sigma is finite and >= 0;
  // anything else is undefined behaviour further down the pipeline.
  static Radius unchecked(double sigma) noexcept;

  static bool isValid(double sigma) noexcept;

  double sigma() const { return sigma_; }

private:
  struct UncheckedTag {};
  Radius(double sigma, UncheckedTag) noexcept : sigma_(sigma) {}

  double sigma_;
};

} // namespace fastblur
