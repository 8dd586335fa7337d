#include <qp/io/curve_csv.hpp>
#include <qp/instruments/interest_rate_swap.hpp>

#include <iostream>
#include <iomanip>
#include <string>
#include <vector>
#include <stdexcept>
#include <utility>

static void print_usage(const char* prog) {
  std::cerr << "Usage: " << prog
            << " curve.csv notional maturity payments_per_year"
            << " [--fixed VAL | --par] [--t VAL]\n"
            << "Without --fixed, the swap is struck at its par rate.\n";
}

int main(int argc, char** argv) {
  if (argc < 5) {
    print_usage(argv[0]);
    return 1;
  }

  std::string path = argv[1];
  double notional, maturity, t = 0.0;
  double fixed = 0.0;
  bool par = true;
  int ppy;
  try {
    notional = std::stod(argv[2]);
    maturity = std::stod(argv[3]);
    ppy      = std::stoi(argv[4]);
    for (int i = 5; i < argc; ++i) {
      const std::string a = argv[i];
      if (a == "--fixed" && i + 1 < argc) { fixed = std::stod(argv[++i]); par = false; }
      else if (a == "--par")               { par = true; }
      else if (a == "--t" && i + 1 < argc) { t = std::stod(argv[++i]); }
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
    const auto curve = qp::io::load_term_structure(path);
    auto times = qp::instruments::make_payment_times(maturity, ppy);

    if (par) {
      const qp::instruments::InterestRateSwap probe(notional, 0.0, times);
      fixed = probe.swap_rate(curve, t);
    }
    const qp::instruments::InterestRateSwap swap(notional, fixed, std::move(times));

    std::cout.setf(std::ios::fixed);
    std::cout << std::setprecision(6);
    std::cout << "fixed_rate    : " << swap.fixed_rate()                << "\n"
              << "swap_rate     : " << swap.swap_rate(curve, t)         << "\n"
              << "pv_fixed      : " << swap.pv_fixed_leg(curve, t)      << "\n"
              << "pv_floating   : " << swap.pv_floating_leg(curve, t)   << "\n"
              << "price         : " << swap.price(curve, t)             << "\n"
              << "n_payments    : " << swap.payment_times().size()      << "\n";
  } catch (const std::runtime_error& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 2;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 3;
  }
  return 0;
}
