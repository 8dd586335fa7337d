#include <qp/io/historic_csv.hpp>
#include <qp/io/csv_text.hpp>

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

std::vector<Bar> read_historic_csv(const std::string& path, std::vector<std::string>* warnings) {
  std::ifstream f(path);
  if (!f) {
    throw std::runtime_error("read_historic_csv: cannot open " + path);
  }

  std::vector<Bar> out;
  std::string line;
  bool header_seen = false;
  int iDate = -1, iOpen = -1, iHigh = -1, iLow = -1, iClose = -1;
  std::size_t line_no = 0;

  while (std::getline(f, line)) {
    ++line_no;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    const auto l = trim(line);
    if (l.empty() || l.rfind("#", 0) == 0) continue;

    const auto cells = split_csv_line(l);
    if (!header_seen) {
      const auto idx = header_index(cells);
      iDate  = col(idx, {"date", "datetime", "time"});
      iOpen  = col(idx, {"open"});
      iHigh  = col(idx, {"high"});
      iLow   = col(idx, {"low"});
      iClose = col(idx, {"close", "adj close", "adj_close", "price"});
      if (iClose < 0) {
        throw std::runtime_error("read_historic_csv: no close column in " + path);
      }
      header_seen = true;
      continue;
    }

    auto get = [&](int i) -> std::string {
      return (i >= 0 && i < static_cast<int>(cells.size())) ? cells[static_cast<std::size_t>(i)] : std::string();
    };

    Bar b;
    b.date  = get(iDate);
    b.open  = parse_double(get(iOpen));
    b.high  = parse_double(get(iHigh));
    b.low   = parse_double(get(iLow));
    b.close = parse_double(get(iClose));

    if (!std::isfinite(b.close) || b.close <= 0.0) {
      if (warnings) warnings->push_back("Ligne " + std::to_string(line_no) + " ignorée: close invalide");
      continue;
    }
    out.push_back(std::move(b));
  }
  return out;
}

std::vector<double> closes(const std::vector<Bar>& bars) {
  std::vector<double> c;
  c.reserve(bars.size());
  for (const auto& b : bars) c.push_back(b.close);
  return c;
}

} // namespace qp::io
