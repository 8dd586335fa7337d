#pragma once
#include <string>
#include <vector>
#include <cstddef>

#include <qp/curves/term_structure.hpp>

namespace qp::io {

struct CurvePoint {
  double maturity; // années
  double rate;     // décimal (le CSV stocke des pourcentages)
};

// Lit un snapshot de courbe (colonnes maturity, rate ; synonymes acceptés).
// Le taux stocké est en % et divisé par 100. Les colonnes inconnues (index, key...) sont ignorées.
// Retourne uniquement les lignes valides, dans l'ordre du fichier.
// Lève std::runtime_error si le fichier est illisible ou si l'en-tête n'a pas les deux colonnes.
std::vector<CurvePoint>
read_curve_csv(const std::string& path,
               std::size_t* num_ignored = nullptr,
               std::vector<std::string>* warnings = nullptr);

// Snapshot -> TermStructure triée par maturité (doublons : première occurrence gardée).
// Lève core::ValidationError si aucune ligne valide.
curves::TermStructure
load_term_structure(const std::string& path,
                    std::vector<std::string>* warnings = nullptr);

} // namespace qp::io
