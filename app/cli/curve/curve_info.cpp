#include <qp/io/curve_csv.hpp>
#include <qp/curves/term_structure.hpp>

#include <iostream>
#include <iomanip>
#include <string>
#include <vector>
#include <stdexcept>

int main(int argc, char** argv) {
  std::string path;
  std::vector<double> times;
  bool show_warnings = false;
  double shift = 0.0;

  try {
    for (int i = 1; i < argc; ++i) {
      std::string a = argv[i];
      if ((a == "-f" || a == "--file") && i + 1 < argc) { path = argv[++i]; }
      else if (a == "-w" || a == "--show-warnings")      { show_warnings = true; }
      else if (a == "--shift" && i + 1 < argc)           { shift = std::stod(argv[++i]); }
      else if (a == "-h" || a == "--help") {
        std::cout << "Usage: curve_info -f <curve.csv> [-w] [--shift VAL] [t ...]\n";
        return 0;
      }
      else if (path.empty()) { path = a; }
      else { times.push_back(std::stod(a)); }
    }
  } catch (const std::exception&) {
    std::cerr << "Usage: curve_info -f <curve.csv> [-w] [--shift VAL] [t ...]\n";
    return 1;
  }
  if (path.empty()) {
    std::cerr << "Please provide a CSV path (-f <curve.csv>).\n";
    return 1;
  }

  std::vector<std::string> warnings;
  try {
    auto curve = qp::io::load_term_structure(path, &warnings);
    if (shift != 0.0) curve = curve.shift_rate(-shift);

    if (show_warnings) {
      for (const auto& w : warnings) std::cerr << "[warn] " << w << "\n";
    }

    std::cout.setf(std::ios::fixed);
    std::cout << std::setprecision(6);
    std::cout << "File: " << path << "\n"
              << "Knots: " << curve.size() << "\n";

    if (times.empty()) times = curve.maturities();

    std::cout << "        t     zero_rate      discount   inst_forward\n";
    for (double t : times) {
      std::cout << std::setw(9)  << t << ' '
                << std::setw(13) << curve.zero_rate(t) << ' '
                << std::setw(13) << curve.discount_factor(t) << ' '
                << std::setw(14) << curve.instantaneous_forward(t) << '\n';
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
