#include <qp/models/gbm.hpp>
#include <qp/core/normal_rng.hpp>
#include <qp/core/stats.hpp>

#include <iostream>
#include <iomanip>
#include <cmath>
#include <stdexcept>
#include <vector>

int main(int argc, char** argv) {
  if (argc != 8) {
    std::cerr << "Usage: " << argv[0] << " S0 r q sigma T seed N\n";
    return 1;
  }
  double S0, r, q, sig, T;
  unsigned long long seed;
  std::size_t N;
  try {
    S0   = std::stod(argv[1]);
    r    = std::stod(argv[2]);
    q    = std::stod(argv[3]);
    sig  = std::stod(argv[4]);
    T    = std::stod(argv[5]);
    seed = std::stoull(argv[6]);
    N    = static_cast<std::size_t>(std::stoull(argv[7]));
  } catch (const std::exception&) {
    std::cerr << "Usage: " << argv[0] << " S0 r q sigma T seed N\n";
    return 1;
  }

  try {
    const qp::models::Gbm model({r, q, sig});
    qp::core::NormalRng rng(seed);

    // Tirages en bloc puis pas exact, comme dans le pricer
    std::vector<double> z;
    rng.sample_block(z, N);

    qp::core::RunningStats acc;
    for (double zi : z) acc.add(model.terminal(S0, T, zi));

    const double mean_th = S0 * std::exp((r - q) * T);
    const double var_th  = mean_th * mean_th * (std::exp(sig * sig * T) - 1.0);

    std::cout.setf(std::ios::fixed);
    std::cout << std::setprecision(6);
    std::cout << "mean_emp=" << acc.mean() << " mean_th=" << mean_th
              << " rel_err=" << std::abs(acc.mean() - mean_th) / mean_th
              << " se=" << acc.std_error() << "\n";
    std::cout << "var_emp="  << acc.variance() << " var_th=" << var_th
              << " rel_err=" << std::abs(acc.variance() - var_th) / var_th << "\n";
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 3;
  }
  return 0;
}
