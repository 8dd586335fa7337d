#include <qp/models/gbm.hpp>
#include <qp/core/normal_rng.hpp>
#include <qp/core/stats.hpp>
#include <qp/core/errors.hpp>

#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

int main() {
  const double S0 = 100.0, r = 0.03, q = 0.01, sig = 0.25, T = 2.0;
  const std::size_t N = 200'000;

  qp::models::Gbm model({r, q, sig});
  qp::core::NormalRng rng(2024);

  qp::core::RunningStats acc;
  for (std::size_t i = 0; i < N; ++i) acc.add(model.sample_ST(S0, T, rng));

  const double mean_th = S0 * std::exp((r - q) * T);
  const double var_th  = mean_th * mean_th * (std::exp(sig * sig * T) - 1.0);

  assert(acc.count() == N);
  assert(std::abs(acc.mean() - mean_th) < 5.0 * std::sqrt(var_th / N));
  assert(std::abs(acc.variance() - var_th) / var_th < 0.03);

  // Z = 0 : médiane lognormale
  const double med = model.terminal(S0, T, 0.0);
  assert(std::abs(med - S0 * std::exp((r - q - 0.5 * sig * sig) * T)) < 1e-12);

  // Flux : même graine => même suite ; la copie repart du début
  {
    qp::core::NormalRng a(99), b(99);
    std::vector<double> za, zb;
    a.sample_block(za, 16);
    b.sample_block(zb, 16);
    assert(za == zb);

    qp::core::NormalRng c(a);
    assert(c.seed() == 99);
    std::vector<double> zc;
    c.sample_block(zc, 16);
    assert(zc == za);
  }

  // Stats : variance indéfinie sous deux points
  {
    qp::core::RunningStats one;
    one.add(1.0);
    assert(std::isnan(one.variance()));
  }

  bool threw = false;
  try { qp::models::Gbm bad({r, q, -0.1}); } catch (const qp::core::DomainError&) { threw = true; }
  assert(threw);

  std::cout << "GBM moments OK. mean=" << acc.mean() << " (th " << mean_th << ")\n";
  return 0;
}
