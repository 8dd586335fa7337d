#include <qp/pricing/implied_vol.hpp>
#include <qp/pricing/analytic_bs.hpp>
#include <qp/market/market_data.hpp>
#include <qp/market/option.hpp>

#include <cmath>
#include <cassert>
#include <iostream>
#include <vector>
#include <algorithm>

using qp::market::MarketData;
using qp::market::Option;
using qp::market::OptionType;

int main() {
  const double S0 = 100.0, r = 0.01, q = 0.00, T = 0.75;
  const double SIG_TRUE = 0.30;

  const qp::pricing::AnalyticBs truth(MarketData(S0, r, q), SIG_TRUE);
  // la sigma du modèle passé au solveur ne doit pas compter
  const qp::pricing::AnalyticBs model(MarketData(S0, r, q), 0.05);

  std::vector<double> Ks {60, 70, 80, 90, 100, 110, 120, 140, 160};

  // 1) Exactitude : prix synthétiques -> retrouve sigma à 1e-6 près (calls & puts)
  double devmax = 0.0;
  for (double K : Ks) {
    for (OptionType t : {OptionType::Call, OptionType::Put}) {
      const Option opt(K, T, t);
      const auto iv = qp::pricing::implied_vol(model, opt, truth.price(opt));
      assert(iv.has_solution());
      assert(iv.iters <= 100);
      assert(std::abs(iv.sigma - SIG_TRUE) < 1e-6);
      devmax = std::max(devmax, std::abs(iv.sigma - SIG_TRUE));
    }
  }

  // 2) Prix hors bornes de non-arbitrage : sentinelle, pas d'exception
  {
    const Option itm_call(80.0, T, OptionType::Call);
    const auto below = qp::pricing::implied_vol(model, itm_call, 0.0);
    assert(!below.has_solution());
    assert(std::isnan(below.sigma));
    assert(below.iters == 0);

    const auto above = qp::pricing::implied_vol(model, itm_call, 150.0);
    assert(!above.has_solution());
    assert(std::isnan(above.sigma));

    const auto nan_price = qp::pricing::implied_vol(model, itm_call, std::nan(""));
    assert(!nan_price.has_solution());
  }

  // 3) Brent nu sur une fonction simple
  {
    const auto root = qp::pricing::brent_solve([](double x) { return x * x - 2.0; },
                                               0.0, 2.0, 1e-12, 100);
    assert(root.converged);
    assert(std::abs(root.sigma - std::sqrt(2.0)) < 1e-10);

    const auto none = qp::pricing::brent_solve([](double x) { return x * x + 1.0; },
                                               -1.0, 1.0, 1e-12, 100);
    assert(!none.converged && std::isnan(none.sigma));
  }

  std::cout << "IV solver OK. Max dev=" << devmax << "\n";
  return 0;
}
