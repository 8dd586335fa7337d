#pragma once
/**
 * @file stats.hpp
 * @brief Accumulateur en streaming (Welford) + IC 95 % pour les estimateurs Monte Carlo.
 *
 * - Variance d'échantillon (diviseur n-1), NaN si n < 2.
 * - Erreur standard sqrt(variance / n), NaN si n == 0.
 */

#include <cstddef>

namespace qp {
namespace core {

class RunningStats {
public:
  RunningStats() noexcept = default;

  void add(double x) noexcept;

  std::size_t count() const noexcept { return n_; }
  double mean() const noexcept { return mean_; }

  [[nodiscard]] double variance() const noexcept;
  [[nodiscard]] double std_error() const noexcept;

private:
  std::size_t n_{0};
  double mean_{0.0};
  double m2_{0.0}; // somme des carrés des écarts à la moyenne
};

struct ConfidenceInterval {
  double low;
  double high;
};

/// @brief mean ± z * std_error, z ≈ 1.96 (normale bilatérale).
[[nodiscard]] ConfidenceInterval confidence_interval_95(double mean, double std_error) noexcept;

} // namespace core
} // namespace qp
