#pragma once
// Loi normale standard : CDF via erfc (stable dans les queues) et densité.

#include <cmath>

namespace qp {
namespace core {

inline double norm_cdf(double x) noexcept {
  constexpr double INV_SQRT2 = 0.70710678118654752440084436210484903928;
  return 0.5 * std::erfc(-x * INV_SQRT2);
}

inline double norm_pdf(double x) noexcept {
  constexpr double INV_SQRT_2PI = 0.39894228040143267793994605993438;
  return INV_SQRT_2PI * std::exp(-0.5 * x * x);
}

} // namespace core
} // namespace qp
