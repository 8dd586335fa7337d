#pragma once
/**
 * @file errors.hpp
 * @brief Taxonomie des erreurs de la bibliothèque.
 *
 * - ValidationError : construction mal formée (tailles incohérentes, échéancier vide,
 *   fréquence non positive...). Dérive de std::invalid_argument.
 * - DomainError : entrées de pricing dégénérées (vol <= 0, T <= 0, spot/strike <= 0)
 *   qui produiraient un résultat indéfini ou infini. Dérive de std::domain_error.
 *
 * L'échec du solveur de volatilité implicite n'est PAS une exception : voir IvResult.
 */

#include <stdexcept>
#include <string>

namespace qp {
namespace core {

class ValidationError : public std::invalid_argument {
public:
  explicit ValidationError(const std::string& what) : std::invalid_argument(what) {}
};

class DomainError : public std::domain_error {
public:
  explicit DomainError(const std::string& what) : std::domain_error(what) {}
};

} // namespace core
} // namespace qp
