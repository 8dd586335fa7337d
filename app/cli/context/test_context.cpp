#include <qp/pricing/context.hpp>
#include <qp/core/errors.hpp>

#include <cassert>
#include <cmath>
#include <iostream>

using qp::market::Option;
using qp::market::OptionType;

int main() {
  const qp::curves::TermStructure curve({0.5, 1.0, 2.0}, {0.01, 0.02, 0.03});
  const qp::pricing::PricingContext ctx(curve, 100.0, 0.01, 0.0, 0.2,
                                        qp::config::McConfig(50'000, 11));

  // 1) Taux lu sur la courbe à la maturité de l'option
  assert(ctx.rate_for(1.0) == 0.02);
  assert(std::abs(ctx.rate_for(1.5) - 0.025) < 1e-15);
  const auto md = ctx.market_for(2.0);
  assert(md.S0 == 100.0 && md.r == 0.03 && md.q == 0.01 && md.repo == 0.0);

  // 2) Modèle analytique construit depuis le contexte
  const Option call(100.0, 1.0, OptionType::Call);
  const auto bs = ctx.analytic_for(call);
  const qp::pricing::AnalyticBs direct(qp::market::MarketData(100.0, 0.02, 0.01), 0.2);
  assert(bs.price(call) == direct.price(call));

  // 3) Monte Carlo : cohérent avec l'analytique, reproductible d'un pricer à l'autre
  auto mc1 = ctx.monte_carlo_for(call);
  auto mc2 = ctx.monte_carlo_for(call);
  const auto res = mc1.price_european(call);
  assert(std::abs(res.price - bs.price(call)) < 4.0 * res.std_error);
  assert(mc2.price(call) == res.price);

  // 4) Future au taux de la courbe
  const auto fut = ctx.future_for(2.0);
  assert(std::abs(fut.price() - 100.0 * std::exp((0.03 - 0.01) * 2.0)) < 1e-12);

  // 5) Validation
  bool threw = false;
  try { qp::pricing::PricingContext bad(curve, 100.0, 0.0, 0.0, 0.0); }
  catch (const qp::core::DomainError&) { threw = true; }
  assert(threw);

  std::cout << "PricingContext OK. bs=" << bs.price(call) << " mc=" << res.price << "\n";
  return 0;
}
