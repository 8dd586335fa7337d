#include <qp/io/historic_csv.hpp>
#include <qp/market/volatility.hpp>

#include <iostream>
#include <iomanip>
#include <string>
#include <vector>
#include <stdexcept>
#include <cstddef>

int main(int argc, char** argv) {
  std::string path;
  std::size_t window = 0; // 0 = toute la série
  double ppy = 252.0;
  bool show_warnings = false;

  try {
    for (int i = 1; i < argc; ++i) {
      std::string a = argv[i];
      if ((a == "-f" || a == "--file") && i + 1 < argc) { path = argv[++i]; }
      else if (a == "--window" && i + 1 < argc) { window = static_cast<std::size_t>(std::stoul(argv[++i])); }
      else if (a == "--ppy" && i + 1 < argc)    { ppy = std::stod(argv[++i]); }
      else if (a == "-w" || a == "--show-warnings") { show_warnings = true; }
      else if (a == "-h" || a == "--help") {
        std::cout << "Usage: hist_vol -f <prices.csv> [--window N] [--ppy VAL] [-w]\n";
        return 0;
      }
      else if (path.empty()) { path = a; }
    }
  } catch (const std::exception&) {
    std::cerr << "Usage: hist_vol -f <prices.csv> [--window N] [--ppy VAL] [-w]\n";
    return 1;
  }
  if (path.empty()) {
    std::cerr << "Please provide a CSV path (-f <prices.csv>).\n";
    return 1;
  }

  std::vector<std::string> warnings;
  try {
    const auto bars = qp::io::read_historic_csv(path, &warnings);
    if (show_warnings) {
      for (const auto& w : warnings) std::cerr << "[warn] " << w << "\n";
    }

    auto px = qp::io::closes(bars);
    // fenêtre de N rendements = N + 1 clôtures
    if (window > 0 && px.size() > window + 1) {
      px.erase(px.begin(), px.end() - static_cast<std::ptrdiff_t>(window + 1));
    }

    std::cout.setf(std::ios::fixed);
    std::cout << std::setprecision(6);
    std::cout << "File: " << path << "\n"
              << "Bars: " << bars.size() << "\n"
              << "Closes used: " << px.size() << "\n";
    if (!bars.empty()) {
      std::cout << "Last: " << bars.back().date << " close=" << bars.back().close << "\n";
    }
    std::cout << "Realized vol (annualized): " << qp::market::realized_volatility(px, ppy) << "\n";
  } catch (const std::runtime_error& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 2;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 3;
  }
  return 0;
}
