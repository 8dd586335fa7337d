#include <qp/io/curve_csv.hpp>
#include <qp/io/csv_text.hpp>
#include <qp/core/errors.hpp>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <stdexcept>
#include <utility>

namespace qp::io {

using detail::col;
using detail::header_index;
using detail::parse_double;
using detail::split_csv_line;
using detail::trim;

std::vector<CurvePoint>
read_curve_csv(const std::string& path,
               std::size_t* num_ignored,
               std::vector<std::string>* warnings)
{
  if (num_ignored) *num_ignored = 0;
  std::vector<CurvePoint> out;

  std::ifstream f(path);
  if (!f) {
    throw std::runtime_error("read_curve_csv: cannot open " + path);
  }

  std::string line;
  bool header_seen = false;
  int iMat = -1, iRate = -1;
  std::size_t line_no = 0;

  while (std::getline(f, line)) {
    ++line_no;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    const auto l = trim(line);
    if (l.empty() || l.rfind("#", 0) == 0) continue;

    const auto cells = split_csv_line(l);

    if (!header_seen) {
      const auto idx = header_index(cells);
      iMat  = col(idx, {"maturity", "t", "tenor", "years"});
      iRate = col(idx, {"rate", "zero_rate", "r"});
      if (iMat < 0 || iRate < 0) {
        throw std::runtime_error("read_curve_csv: header must name a maturity and a rate column in " + path);
      }
      header_seen = true;
      continue;
    }

    auto get = [&](int i) -> std::string {
      return (i >= 0 && i < static_cast<int>(cells.size())) ? cells[static_cast<std::size_t>(i)] : std::string();
    };

    const double m  = parse_double(get(iMat));
    const double rp = parse_double(get(iRate));

    std::string why;
    if (!std::isfinite(m) || m <= 0.0) why = "maturité <= 0 ou invalide";
    else if (!std::isfinite(rp))       why = "taux invalide";

    if (!why.empty()) {
      if (num_ignored) (*num_ignored)++;
      if (warnings) warnings->push_back("Ligne " + std::to_string(line_no) + " ignorée: " + why);
      continue;
    }

    out.push_back({m, rp / 100.0});
  }

  return out;
}

curves::TermStructure
load_term_structure(const std::string& path, std::vector<std::string>* warnings)
{
  auto pts = read_curve_csv(path, nullptr, warnings);
  if (pts.empty()) {
    throw core::ValidationError("load_term_structure: no valid point in " + path);
  }

  std::stable_sort(pts.begin(), pts.end(),
                   [](const CurvePoint& a, const CurvePoint& b){ return a.maturity < b.maturity; });

  std::vector<double> mats, rates;
  mats.reserve(pts.size());
  rates.reserve(pts.size());
  for (const auto& p : pts) {
    if (!mats.empty() && p.maturity == mats.back()) {
      if (warnings) warnings->push_back("Maturité en double ignorée: " + std::to_string(p.maturity));
      continue;
    }
    mats.push_back(p.maturity);
    rates.push_back(p.rate);
  }
  return curves::TermStructure(std::move(mats), std::move(rates));
}

} // namespace qp::io
