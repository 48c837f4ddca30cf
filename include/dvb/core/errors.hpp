#pragma once
/**
 * @file errors.hpp
 * @brief Taxonomie des erreurs du moteur de diversion.
 *
 * - NotFoundError      : route ou classe de navire absente des données de référence.
 * - InvalidConfigError : paramètre de règle / de stress hors domaine, ligne de référence
 *                        dupliquée ou navire incohérent.
 * - EmptyInputError    : backtest lancé sur une série vide.
 *
 * Toutes les erreurs sont levées de façon synchrone au point de détection ;
 * aucune n'est interceptée ni rejouée dans le cœur de calcul.
 */

#include <stdexcept>
#include <string>
#include <utility>

namespace dvb {
namespace core {

/// @brief Clé absente d'une table de référence (route, navire, facteur CO2).
class NotFoundError : public std::out_of_range {
public:
  NotFoundError(const std::string& what, std::string key)
      : std::out_of_range(what + ": " + key), key_(std::move(key)) {}

  /// @return Clé recherchée (ex : "US_Gulf -> Tokyo").
  const std::string& key() const noexcept { return key_; }

private:
  std::string key_;
};

/// @brief Paramètre hors de son domaine de validité.
class InvalidConfigError : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

/// @brief Série d'entrée vide là où au moins une observation est requise.
class EmptyInputError : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

} // namespace core
} // namespace dvb
