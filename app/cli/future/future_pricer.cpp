#include <qp/io/curve_csv.hpp>
#include <qp/instruments/equity_future.hpp>

#include <iostream>
#include <iomanip>
#include <string>
#include <stdexcept>

static void print_usage(const char* prog) {
  std::cerr << "Usage: " << prog << " spot rate dividend_yield maturity"
            << " [--mtm curve.csv t spot_t]\n";
}

int main(int argc, char** argv) {
  if (argc != 5 && argc != 9) {
    print_usage(argv[0]);
    return 1;
  }

  double spot, rate, div, T;
  double t = 0.0, spot_t = 0.0;
  std::string curve_path;
  try {
    spot = std::stod(argv[1]);
    rate = std::stod(argv[2]);
    div  = std::stod(argv[3]);
    T    = std::stod(argv[4]);
    if (argc == 9) {
      if (std::string(argv[5]) != "--mtm") {
        print_usage(argv[0]);
        return 1;
      }
      curve_path = argv[6];
      t      = std::stod(argv[7]);
      spot_t = std::stod(argv[8]);
    }
  } catch (const std::exception&) {
    print_usage(argv[0]);
    return 1;
  }

  try {
    const qp::instruments::EquityFuture fut(spot, rate, div, T);

    std::cout.setf(std::ios::fixed);
    std::cout << std::setprecision(6);
    std::cout << "forward_price : " << fut.price() << "\n";

    if (!curve_path.empty()) {
      const auto curve = qp::io::load_term_structure(curve_path);
      std::cout << "t             : " << t << "\n"
                << "spot_t        : " << spot_t << "\n"
                << "long_value    : " << fut.long_value(t, spot_t, curve) << "\n";
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
