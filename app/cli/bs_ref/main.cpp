#include <qp/market/market_data.hpp>
#include <qp/market/option.hpp>
#include <qp/pricing/analytic_bs.hpp>

#include <iostream>
#include <iomanip>
#include <vector>
#include <string>
#include <stdexcept>

struct Case {
  double S0, K, r, q, sigma, T;
};

static void print_usage(const char* prog) {
  std::cerr << "Usage: " << prog << " [S0 K r q sigma T] [--repo VAL] [--greeks]\n"
            << "If no market arguments are provided, runs 3 reference cases.\n";
}

int main(int argc, char** argv) {
  std::cout.setf(std::ios::fixed);
  std::cout << std::setprecision(6);

  std::vector<std::string> pos;
  double repo = 0.0;
  bool want_greeks = false;
  try {
    for (int i = 1; i < argc; ++i) {
      const std::string a = argv[i];
      if (a == "--repo" && i + 1 < argc) repo = std::stod(argv[++i]);
      else if (a == "--greeks")          want_greeks = true;
      else if (a == "-h" || a == "--help") { print_usage(argv[0]); return 0; }
      else                               pos.push_back(a);
    }
  } catch (const std::exception&) {
    print_usage(argv[0]);
    return 1;
  }

  std::vector<Case> cases;
  if (pos.empty()) {
    cases.push_back({100.0, 100.0, 0.02, 0.00, 0.20, 1.00});
    cases.push_back({100.0, 110.0, 0.02, 0.00, 0.25, 0.50});
    cases.push_back({80.0,  100.0, -0.01, 0.01, 0.35, 2.00}); // r/q négatifs admis
  } else if (pos.size() == 6) {
    Case c;
    try {
      c.S0    = std::stod(pos[0]);
      c.K     = std::stod(pos[1]);
      c.r     = std::stod(pos[2]);
      c.q     = std::stod(pos[3]);
      c.sigma = std::stod(pos[4]);
      c.T     = std::stod(pos[5]);
    } catch (const std::exception&) {
      print_usage(argv[0]);
      return 1;
    }
    cases.push_back(c);
  } else {
    print_usage(argv[0]);
    return 1;
  }

  try {
    std::cout << " S0       K        r        q     sigma        T        Call        Put    ParityGap\n";
    std::cout << "-------------------------------------------------------------------------------------\n";
    for (const auto& c : cases) {
      const qp::pricing::AnalyticBs model(qp::market::MarketData(c.S0, c.r, c.q, repo), c.sigma);
      const qp::market::Option call_opt(c.K, c.T, qp::market::OptionType::Call);
      const qp::market::Option put_opt (c.K, c.T, qp::market::OptionType::Put);

      const double call = model.price(call_opt);
      const double put  = model.price(put_opt);
      const double gap  = qp::pricing::put_call_parity_gap(call, put, c.S0, c.K, c.r, c.q, c.T);

      std::cout << std::setw(7)  << c.S0   << ' '
                << std::setw(7)  << c.K    << ' '
                << std::setw(8)  << c.r    << ' '
                << std::setw(8)  << c.q    << ' '
                << std::setw(8)  << c.sigma<< ' '
                << std::setw(9)  << c.T    << ' '
                << std::setw(11) << call   << ' '
                << std::setw(10) << put    << ' '
                << std::setw(11) << gap    << '\n';

      if (want_greeks) {
        for (const auto* opt : {&call_opt, &put_opt}) {
          std::cout << "   " << std::setw(4) << qp::market::to_string(opt->type)
                    << "  delta=" << model.delta(*opt)
                    << "  gamma=" << model.gamma(*opt)
                    << "  vega="  << model.vega(*opt)
                    << "  rho="   << model.rho(*opt) << '\n';
        }
      }
    }
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 3;
  }
  return 0;
}
