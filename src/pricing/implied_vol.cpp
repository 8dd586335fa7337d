#include <qp/pricing/implied_vol.hpp>

#include <cmath>
#include <limits>
#include <utility>

namespace qp {
namespace pricing {

namespace {

inline IvResult no_solution() noexcept {
  return IvResult{std::numeric_limits<double>::quiet_NaN(), 0, false};
}

} // namespace

IvResult brent_solve(const std::function<double(double)>& f,
                     double a, double b, double tol, int max_iters) {
  double fa = f(a);
  double fb = f(b);

  if (!std::isfinite(fa) || !std::isfinite(fb) || fa * fb > 0.0) {
    return no_solution();
  }
  if (std::fabs(fa) < tol) return IvResult{a, 0, true};
  if (std::fabs(fb) < tol) return IvResult{b, 0, true};

  // |f(b)| <= |f(a)| : b est la meilleure estimation courante
  if (std::fabs(fa) < std::fabs(fb)) {
    std::swap(a, b);
    std::swap(fa, fb);
  }

  double c = a, fc = fa;
  double d = c;       // avant-dernier itéré (utilisé seulement si !bisect)
  bool bisect = true; // dernier pas = bisection

  for (int it = 1; it <= max_iters; ++it) {
    double s;
    if (fa != fc && fb != fc) {
      // interpolation quadratique inverse
      s = a * fb * fc / ((fa - fb) * (fa - fc))
        + b * fa * fc / ((fb - fa) * (fb - fc))
        + c * fa * fb / ((fc - fa) * (fc - fb));
    } else {
      // sécante
      s = b - fb * (b - a) / (fb - fa);
    }

    const double q34 = (3.0 * a + b) / 4.0;
    const bool out_of_range = !((s > q34 && s < b) || (s < q34 && s > b));
    const bool slow_after_bisect = bisect && std::fabs(s - b) >= std::fabs(b - c) / 2.0;
    const bool slow_after_interp = !bisect && std::fabs(s - b) >= std::fabs(c - d) / 2.0;
    const bool tiny_after_bisect = bisect && std::fabs(b - c) < tol;
    const bool tiny_after_interp = !bisect && std::fabs(c - d) < tol;

    if (out_of_range || slow_after_bisect || slow_after_interp
        || tiny_after_bisect || tiny_after_interp) {
      s = 0.5 * (a + b);
      bisect = true;
    } else {
      bisect = false;
    }

    const double fs = f(s);
    d = c;
    c = b;
    fc = fb;

    if (fa * fs < 0.0) { b = s; fb = fs; }
    else               { a = s; fa = fs; }

    if (std::fabs(fa) < std::fabs(fb)) {
      std::swap(a, b);
      std::swap(fa, fb);
    }

    if (std::fabs(fb) < tol || std::fabs(b - a) < tol) {
      return IvResult{b, it, true};
    }
  }

  // max_iters atteint : pas de solution certifiée
  IvResult out = no_solution();
  out.iters = max_iters;
  return out;
}

IvResult implied_vol(const AnalyticBs& model,
                     const market::Option& opt,
                     double market_price,
                     const IvConfig& cfg) {
  if (!std::isfinite(market_price)) {
    return no_solution();
  }
  auto f = [&](double s) { return model.price(opt, s) - market_price; };
  return brent_solve(f, cfg.sigma_lo, cfg.sigma_hi, cfg.tol, cfg.max_iters);
}

} // namespace pricing
} // namespace qp
