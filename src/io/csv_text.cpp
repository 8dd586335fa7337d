#include <qp/io/csv_text.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>

namespace qp::io::detail {

std::string trim(std::string s) {
  auto notsp = [](unsigned char ch){ return !std::isspace(ch); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), notsp));
  s.erase(std::find_if(s.rbegin(), s.rend(), notsp).base(), s.end());
  return s;
}

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::tolower(c); });
  return s;
}

std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> out;
  std::string field;
  bool in_quotes = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (c == '"') {
      if (in_quotes && i + 1 < line.size() && line[i + 1] == '"') { field.push_back('"'); ++i; }
      else { in_quotes = !in_quotes; }
    } else if (c == ',' && !in_quotes) {
      out.push_back(trim(field)); field.clear();
    } else {
      field.push_back(c);
    }
  }
  out.push_back(trim(field));
  return out;
}

double parse_double(const std::string& s) {
  if (s.empty()) return std::numeric_limits<double>::quiet_NaN();
  char* end = nullptr;
  const double v = std::strtod(s.c_str(), &end);
  if (end == s.c_str()) return std::numeric_limits<double>::quiet_NaN();
  return v;
}

std::unordered_map<std::string, int> header_index(const std::vector<std::string>& header) {
  std::unordered_map<std::string, int> idx;
  for (int i = 0; i < static_cast<int>(header.size()); ++i) {
    idx.emplace(lower(trim(header[static_cast<std::size_t>(i)])), i);
  }
  return idx;
}

int col(const std::unordered_map<std::string, int>& idx, std::initializer_list<const char*> names) {
  for (auto* n : names) {
    auto it = idx.find(lower(n));
    if (it != idx.end()) return it->second;
  }
  return -1;
}

} // namespace qp::io::detail
