#include <qp/pricing/analytic_bs.hpp>
#include <qp/market/market_data.hpp>
#include <qp/market/option.hpp>
#include <qp/core/errors.hpp>

#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

using qp::market::MarketData;
using qp::market::Option;
using qp::market::OptionType;
using qp::pricing::AnalyticBs;

namespace {

template <class Fn>
bool throws_domain(Fn&& fn) {
  try { fn(); } catch (const qp::core::DomainError&) { return true; }
  return false;
}

} // namespace

int main() {
  // 1) Cas de référence : S = K = 100, r = 2 %, sigma = 20 %, T = 1 (d1 = 0.2, d2 = 0)
  const AnalyticBs model(MarketData(100.0, 0.02), 0.20);
  const Option call(100.0, 1.0, OptionType::Call);
  const Option put (100.0, 1.0, OptionType::Put);

  const double c = model.price(call);
  assert(std::abs(c - 8.92) < 0.01);
  assert(std::abs(c - 8.916037) < 1e-6);
  assert(std::abs(model.d1(call) - 0.2) < 1e-14);
  assert(std::abs(model.d2(call)) < 1e-14);

  assert(std::abs(model.delta(call) - 0.579260) < 1e-6);
  assert(std::abs(model.delta(put)  - (0.579260 - 1.0)) < 1e-6);
  assert(std::abs(model.gamma(call) - 0.019552) < 1e-6);
  assert(model.gamma(call) == model.gamma(put));
  assert(std::abs(model.vega(call)  - 39.104269) < 1e-6);
  assert(std::abs(model.rho(call)   - 49.009934) < 1e-6);

  // 2) Parité call-put sur une grille, avec dividende et repo
  const std::vector<double> Ks {60, 80, 95, 100, 105, 120, 160};
  const std::vector<double> Ts {0.1, 0.5, 1.0, 3.0};
  for (double q : {0.0, 0.015}) {
    for (double repo : {0.0, 0.005}) {
      const AnalyticBs m(MarketData(100.0, 0.03, q, repo), 0.25);
      for (double K : Ks) {
        for (double T : Ts) {
          const double cp = m.price(Option(K, T, OptionType::Call));
          const double pp = m.price(Option(K, T, OptionType::Put));
          const double gap = qp::pricing::put_call_parity_gap(cp, pp, 100.0, K, 0.03, q, T);
          assert(std::abs(gap) < 1e-10);
        }
      }
    }
  }

  // 3) Le repo ne déplace que d1 ; la jambe spot reste actualisée au dividende
  {
    const AnalyticBs m(MarketData(100.0, 0.03, 0.01, 0.02), 0.25);
    const Option oc(100.0, 1.0, OptionType::Call);
    const Option op(100.0, 1.0, OptionType::Put);
    assert(std::abs(m.d1(oc) - 0.125) < 1e-14);
    const double cp = m.price(oc);
    const double pp = m.price(op);
    assert(std::abs(cp - 10.731371) < 1e-6);
    assert(std::abs(pp - 8.770941) < 1e-6);
    assert(std::abs((cp - pp) - 1.960430) < 1e-6);
    assert(std::abs(m.delta(oc) - 0.544268) < 1e-6);
    assert(std::abs(m.delta(oc) - std::exp(-0.01) * 0.549738) < 1e-6);

    // même portage total, répartition différente : prix différents
    const AnalyticBs all_div(MarketData(100.0, 0.03, 0.03, 0.0), 0.25);
    assert(std::abs(all_div.d1(oc) - m.d1(oc)) < 1e-14);
    assert(all_div.price(oc) < cp);
  }

  // 3b) Formes libres : identiques à la classe sans repo, cas limites T = 0 et sigma = 0
  {
    using qp::pricing::price_call_bs;
    using qp::pricing::price_put_bs;
    const AnalyticBs m(MarketData(100.0, 0.03, 0.01), 0.25);
    const Option oc(110.0, 0.5, OptionType::Call);
    const Option op(110.0, 0.5, OptionType::Put);
    assert(std::abs(price_call_bs(100.0, 110.0, 0.03, 0.01, 0.25, 0.5) - m.price(oc)) < 1e-12);
    assert(std::abs(price_put_bs (100.0, 110.0, 0.03, 0.01, 0.25, 0.5) - m.price(op)) < 1e-12);
    assert(price_call_bs(120.0, 100.0, 0.03, 0.0, 0.25, 0.0) == 20.0);
    assert(price_put_bs (120.0, 100.0, 0.03, 0.0, 0.25, 0.0) == 0.0);
    const double fwd = 100.0 * std::exp(0.02);
    assert(std::abs(price_call_bs(100.0, 95.0, 0.03, 0.01, 0.0, 1.0)
                    - std::exp(-0.03) * (fwd - 95.0)) < 1e-12);
  }

  // 4) Greeks analytiques vs différences finies sur le prix
  {
    const double S = 100.0, r = 0.01, q = 0.02, sig = 0.3, h = 1e-4;
    const AnalyticBs base(MarketData(S, r, q), sig);
    const AnalyticBs up  (MarketData(S + h, r, q), sig);
    const AnalyticBs dn  (MarketData(S - h, r, q), sig);
    const AnalyticBs r_up(MarketData(S, r + h, q), sig);
    const AnalyticBs r_dn(MarketData(S, r - h, q), sig);
    for (OptionType t : {OptionType::Call, OptionType::Put}) {
      const Option o(110.0, 0.8, t);
      const double fd_delta = (up.price(o) - dn.price(o)) / (2.0 * h);
      const double fd_gamma = (up.price(o) - 2.0 * base.price(o) + dn.price(o)) / (h * h);
      const double fd_vega  = (base.price(o, sig + h) - base.price(o, sig - h)) / (2.0 * h);
      const double fd_rho   = (r_up.price(o) - r_dn.price(o)) / (2.0 * h);
      assert(std::abs(fd_delta - base.delta(o)) < 1e-6);
      assert(std::abs(fd_gamma - base.gamma(o)) < 1e-3);
      assert(std::abs(fd_vega  - base.vega(o))  < 1e-5);
      assert(std::abs(fd_rho   - base.rho(o))   < 1e-5);
    }
  }

  // 5) Domaine : vol <= 0, maturité / strike / spot <= 0
  assert(throws_domain([&]{ (void)model.price(call, 0.0); }));
  assert(throws_domain([&]{ (void)model.price(call, -0.1); }));
  assert(throws_domain([&]{ (void)AnalyticBs(MarketData(100.0, 0.02), 0.0).delta(call); }));
  assert(throws_domain([]{ (void)Option(100.0, 0.0, OptionType::Call); }));
  assert(throws_domain([]{ (void)Option(0.0, 1.0, OptionType::Put); }));
  assert(throws_domain([]{ (void)MarketData(0.0, 0.02); }));

  std::cout << "Analytic BS OK. call=" << c << " delta=" << model.delta(call) << "\n";
  return 0;
}
