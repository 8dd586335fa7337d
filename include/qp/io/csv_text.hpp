#pragma once
// Petits utilitaires texte partagés par les lecteurs CSV.

#include <initializer_list>
#include <string>
#include <unordered_map>
#include <vector>

namespace qp::io::detail {

std::string trim(std::string s);
std::string lower(std::string s);

// Découpe une ligne CSV ; gère les champs entre "..." et les "" échappés.
std::vector<std::string> split_csv_line(const std::string& line);

// "" ou non numérique -> NaN
double parse_double(const std::string& s);

// En-tête normalisé (minuscules) -> index de colonne
std::unordered_map<std::string, int> header_index(const std::vector<std::string>& header);

// Premier synonyme présent dans l'en-tête, -1 sinon.
int col(const std::unordered_map<std::string, int>& idx, std::initializer_list<const char*> names);

} // namespace qp::io::detail
