#pragma once
#include <string>
#include <vector>
#include <limits>

namespace qp::io {

// Une barre d'une série historique (date conservée telle quelle).
struct Bar {
  std::string date;
  double open  = std::numeric_limits<double>::quiet_NaN();
  double high  = std::numeric_limits<double>::quiet_NaN();
  double low   = std::numeric_limits<double>::quiet_NaN();
  double close = std::numeric_limits<double>::quiet_NaN();
};

// Lit une série open/high/low/close (colonnes date,open,high,low,close ; synonymes acceptés).
// Les lignes sans close exploitable (non fini ou <= 0) sont ignorées et signalées.
// Lève std::runtime_error si le fichier est illisible ou sans colonne close.
std::vector<Bar> read_historic_csv(const std::string& path,
                                   std::vector<std::string>* warnings = nullptr);

// Extrait les clôtures dans l'ordre de la série.
std::vector<double> closes(const std::vector<Bar>& bars);

} // namespace qp::io
