#include <qp/market/market_data.hpp>
#include <qp/market/option.hpp>
#include <qp/pricing/analytic_bs.hpp>
#include <qp/pricing/implied_vol.hpp>

#include <iostream>
#include <iomanip>
#include <string>
#include <stdexcept>

static void print_usage(const char* prog) {
  std::cerr << "Usage: " << prog << " S0 K r q T price [--put] [--repo VAL]\n";
}

int main(int argc, char** argv) {
  if (argc < 7) {
    print_usage(argv[0]);
    return 1;
  }

  double S0, K, r, q, T, price;
  double repo = 0.0;
  bool is_put = false;
  try {
    S0    = std::stod(argv[1]);
    K     = std::stod(argv[2]);
    r     = std::stod(argv[3]);
    q     = std::stod(argv[4]);
    T     = std::stod(argv[5]);
    price = std::stod(argv[6]);
    for (int i = 7; i < argc; ++i) {
      const std::string a = argv[i];
      if (a == "--put")                      is_put = true;
      else if (a == "--repo" && i + 1 < argc) repo = std::stod(argv[++i]);
      else {
        std::cerr << "Unknown option: " << a << "\n";
        print_usage(argv[0]);
        return 1;
      }
    }
  } catch (const std::exception&) {
    print_usage(argv[0]);
    return 1;
  }

  try {
    const qp::market::Option opt(K, T, is_put ? qp::market::OptionType::Put
                                              : qp::market::OptionType::Call);
    // la sigma du modèle est ignorée par l'inversion
    const qp::pricing::AnalyticBs model(qp::market::MarketData(S0, r, q, repo), 0.2);
    const auto iv = qp::pricing::implied_vol(model, opt, price);

    std::cout.setf(std::ios::fixed);
    std::cout << std::setprecision(6);
    std::cout << "type          : " << qp::market::to_string(opt.type) << "\n"
              << "price         : " << price << "\n";
    if (!iv.has_solution()) {
      std::cout << "implied_vol   : n/a (no root in [1e-6, 5])\n";
      return 4;
    }
    std::cout << "implied_vol   : " << iv.sigma << "\n"
              << "iters         : " << iv.iters << "\n"
              << "reprice       : " << model.price(opt, iv.sigma) << "\n";
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 3;
  }
  return 0;
}
