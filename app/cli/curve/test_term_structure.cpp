#include <qp/curves/term_structure.hpp>
#include <qp/core/errors.hpp>

#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

using qp::curves::TermStructure;

namespace {

template <class Fn>
bool throws_validation(Fn&& fn) {
  try { fn(); } catch (const qp::core::ValidationError&) { return true; }
  return false;
}

template <class Fn>
bool throws_domain(Fn&& fn) {
  try { fn(); } catch (const qp::core::DomainError&) { return true; }
  return false;
}

} // namespace

int main() {
  constexpr double EPS = 1e-12;
  const TermStructure curve({1.0, 2.0, 5.0}, {0.02, 0.025, 0.03});

  // 1) Interpolation linéaire entre noeuds : r(3) = 0.025 + 1/3 * 0.005
  assert(std::abs(curve.zero_rate(3.0) - (0.025 + (1.0 / 3.0) * 0.005)) < EPS);
  assert(std::abs(curve.zero_rate(3.0) - 0.0266667) < 1e-6);

  // 2) Noeuds : taux stocké exactement
  assert(curve.zero_rate(1.0) == 0.02);
  assert(curve.zero_rate(2.0) == 0.025);
  assert(curve.zero_rate(5.0) == 0.03);

  // 3) Extrapolation : proportionnelle au temps avant t0, plate après tN
  assert(std::abs(curve.zero_rate(0.5) - 0.01) < EPS);
  assert(curve.zero_rate(0.0) == 0.0);
  assert(curve.zero_rate(30.0) == 0.03);
  assert(curve.discount_factor(0.0) == 1.0);

  // 4) DF strictement décroissant quand r > 0
  double prev = curve.discount_factor(0.05);
  for (double t = 0.1; t <= 12.0; t += 0.05) {
    const double df = curve.discount_factor(t);
    assert(df < prev);
    prev = df;
  }
  assert(std::abs(curve.discount_factor(2.0) - std::exp(-0.05)) < EPS);

  // 5) shift_rate(0) : identité, même avec des taux négatifs
  {
    const auto same = curve.shift_rate(0.0);
    assert(same.maturities() == curve.maturities());
    assert(same.rates() == curve.rates());

    const TermStructure neg({1.0, 2.0}, {-0.005, 0.01});
    const auto neg0 = neg.shift_rate(0.0);
    assert(neg0.size() == 2);
    assert(neg0.rates() == neg.rates());
  }

  // 6) shift_rate : baisse qui rend un noeud négatif => noeud supprimé
  {
    const auto down = curve.shift_rate(0.021);
    assert(down.size() == 2);
    assert(down.maturities().front() == 2.0);
    assert(std::abs(down.zero_rate(2.0) - 0.004) < EPS);

    const auto up = curve.shift_rate(-0.01);
    assert(up.size() == 3);
    assert(std::abs(up.zero_rate(5.0) - 0.04) < EPS);

    // hausse insuffisante : le noeud encore négatif est supprimé aussi
    const TermStructure neg({1.0, 2.0, 3.0}, {-0.02, -0.004, 0.01});
    const auto neg_up = neg.shift_rate(-0.005);
    assert(neg_up.size() == 2);
    assert(neg_up.maturities().front() == 2.0);
    assert(std::abs(neg_up.zero_rate(2.0) - 0.001) < EPS);
    assert(throws_domain([]{ (void)TermStructure({1.0}, {-0.03}).shift_rate(-0.01); }));

    // la courbe source n'est pas modifiée
    assert(curve.size() == 3 && curve.zero_rate(1.0) == 0.02);

    assert(throws_domain([&]{ (void)curve.shift_rate(0.5); }));
  }

  // 7) shift_time : noeuds conservés, taux ré-échantillonnés en t - d
  {
    const auto fwd = curve.shift_time(1.0);
    assert(fwd.size() == 3);
    assert(fwd.zero_rate(1.0) == 0.0);
    assert(std::abs(fwd.zero_rate(2.0) - 0.02) < EPS);
    assert(std::abs(fwd.zero_rate(5.0) - (0.025 + (2.0 / 3.0) * 0.005)) < EPS);

    // le dernier noeud (t_N - 0 = t_N) sort de [0, t_N)
    const auto zero = curve.shift_time(0.0);
    assert(zero.size() == 2);
    assert(zero.maturities().back() == 2.0);

    assert(throws_domain([&]{ (void)curve.shift_time(10.0); }));
  }

  // 8) Forwards
  assert(std::abs(curve.forward_rate(1.0, 2.0) - 0.03) < EPS);
  assert(std::abs(curve.forward_rate(0.0, 2.0) - 0.025) < EPS);
  assert(std::abs(curve.instantaneous_forward(1.5) - 0.03) < EPS);
  assert(std::abs(curve.instantaneous_forward(0.5) - 0.02) < EPS);
  assert(curve.instantaneous_forward(8.0) == 0.03);
  assert(throws_domain([&]{ (void)curve.forward_rate(2.0, 1.0); }));
  assert(throws_domain([&]{ (void)curve.forward_rate(-1.0, 1.0); }));

  // 9) Validation à la construction
  assert(throws_validation([]{ (void)TermStructure({1.0, 2.0}, {0.01}); }));
  assert(throws_validation([]{ (void)TermStructure({}, {}); }));
  assert(throws_validation([]{ (void)TermStructure({1.0, 1.0}, {0.01, 0.02}); }));
  assert(throws_validation([]{ (void)TermStructure({2.0, 1.0}, {0.01, 0.02}); }));
  assert(throws_validation([]{ (void)TermStructure({0.0, 1.0}, {0.01, 0.02}); }));
  assert(throws_validation([]{ (void)TermStructure({1.0}, {std::nan("")}); }));

  std::cout << "TermStructure OK. r(3)=" << curve.zero_rate(3.0) << "\n";
  return 0;
}
