#pragma once
/**
 * @file market_data.hpp
 * @brief Scalaires de marché pour une évaluation (prix, fret, carburant, carbone).
 *
 * # Contenu
 * - price_a / price_b : prix des benchmarks de destination (USD/MMBtu), A = marché
 *   actuel (ex : TTF), B = marché candidat à la diversion (ex : JKM).
 * - freight_rate_usd_day : taux d'affrètement à temps (USD/jour).
 * - fuel_price_usd_t     : prix du carburant (USD/t).
 * - eua_price_usd_t      : prix du quota carbone (USD/tCO2).
 *
 * # Snapshot proxy
 * En l'absence de source temps réel, un snapshot est construit à partir des scalaires
 * de configuration (TTF, EUA, fret, carburant) ; JKM = valeur explicite ou TTF + prime,
 * fret = base * multiplicateur de régime. Chaque champ porte sa provenance.
 */

#include <map>
#include <string>

namespace dvb {
namespace market {

/// @brief Scalaires de marché d'une évaluation.
struct MarketInputs {
  double price_a{0.0};              ///< Prix destination A (USD/MMBtu).
  double price_b{0.0};              ///< Prix destination B (USD/MMBtu).
  double freight_rate_usd_day{0.0}; ///< Affrètement (USD/jour).
  double fuel_price_usd_t{0.0};     ///< Carburant (USD/t).
  double eua_price_usd_t{0.0};      ///< Carbone (USD/tCO2).
};

/// @brief Une observation historique datée (date ISO "YYYY-MM-DD").
struct MarketObservation {
  std::string date;
  MarketInputs inputs;
};

/// @brief Snapshot courant avec provenance ("proxy" ou "real") par champ.
struct MarketSnapshot {
  std::string asof{"latest"};
  MarketInputs inputs;
  std::map<std::string, std::string> provenance; ///< clés : TTF, JKM, FREIGHT, FUEL, EUA
};

/**
 * @brief Construit un snapshot proxy à partir des paramètres de configuration.
 * @param cfg  Table param -> valeur (clés TTF_USD_MMBTU, EUA_USD_PER_TCO2,
 *             FREIGHT_USD_DAY, FUEL_USD_PER_T ; optionnelles JKM_USD_MMBTU,
 *             JKM_PREMIUM_USD_PER_MMBTU, FREIGHT_REGIME_MULTIPLIER).
 * @param asof Étiquette de date du snapshot.
 * @throws core::InvalidConfigError si une clé obligatoire manque.
 */
MarketSnapshot make_proxy_snapshot(const std::map<std::string, double>& cfg,
                                   const std::string& asof = "latest");

} // namespace market
} // namespace dvb
