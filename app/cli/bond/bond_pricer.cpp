#include <qp/io/curve_csv.hpp>
#include <qp/instruments/coupon_bond.hpp>

#include <iostream>
#include <iomanip>
#include <string>
#include <vector>
#include <stdexcept>

static void print_usage(const char* prog) {
  std::cerr << "Usage: " << prog
            << " curve.csv nominal coupon_rate maturity frequency"
            << " [--t VAL] [--cashflows] [--profile MAX_SHIFT STEP]\n";
}

int main(int argc, char** argv) {
  if (argc < 6) {
    print_usage(argv[0]);
    return 1;
  }

  std::string path = argv[1];
  double nominal, coupon, maturity, t = 0.0;
  int frequency;
  bool show_cf = false;
  double prof_max = 0.0, prof_step = 0.0;
  try {
    nominal   = std::stod(argv[2]);
    coupon    = std::stod(argv[3]);
    maturity  = std::stod(argv[4]);
    frequency = std::stoi(argv[5]);
    for (int i = 6; i < argc; ++i) {
      const std::string a = argv[i];
      if (a == "--t" && i + 1 < argc) t = std::stod(argv[++i]);
      else if (a == "--cashflows")    show_cf = true;
      else if (a == "--profile" && i + 2 < argc) {
        prof_max  = std::stod(argv[++i]);
        prof_step = std::stod(argv[++i]);
      } else {
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
    const qp::instruments::CouponBond bond(nominal, coupon, maturity, frequency);

    std::cout.setf(std::ios::fixed);
    std::cout << std::setprecision(6);
    std::cout << "price         : " << bond.price(curve, t)      << "\n"
              << "duration      : " << bond.duration(curve)      << "\n"
              << "convexity     : " << bond.convexity(curve)     << "\n"
              << "n_cashflows   : " << bond.cashflows().size()   << "\n";

    if (show_cf) {
      std::cout << "      time        amount\n";
      for (const auto& cf : bond.cashflows()) {
        std::cout << std::setw(10) << cf.time << ' ' << std::setw(13) << cf.amount << '\n';
      }
    }

    if (prof_step > 0.0) {
      std::vector<double> shifts;
      for (double s = -prof_max; s <= prof_max + 1e-12; s += prof_step) shifts.push_back(s);
      const auto prices = bond.price_shift_profile(curve, shifts);
      std::cout << "     shift         price\n";
      for (std::size_t i = 0; i < shifts.size(); ++i) {
        std::cout << std::setw(10) << shifts[i] << ' ' << std::setw(13) << prices[i] << '\n';
      }
    }
  } catch (const std::runtime_error& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 2;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 3;
  }
  return 0;
}
