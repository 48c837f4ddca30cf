#pragma once
/**
 * @file decision_config.hpp
 * @brief Paramètres de la règle de diversion et des scénarios de stress.
 *
 * # DecisionRule
 * - basis_haircut_pct   : décote appliquée à l'uplift brut (fraction dans [0,1]).
 * - ops_buffer_usd      : déduction forfaitaire (surestaries, frictions) (> 0).
 * - decision_buffer_usd : uplift ajusté minimal pour recommander DIVERT (> 0).
 * - coverage_pct        : ratio de couverture de l'énergie livrée (fraction dans [0,1]).
 * - lot_size_a / _b     : taille de lot (MMBtu) des benchmarks A et B (> 0).
 * - hedge_basis         : base de l'énergie couverte (voir HedgeEnergyBasis).
 * - keep_policy         : jambes de couverture émises sur KEEP (voir KeepHedgePolicy).
 *
 * # StressConfig
 * - Amplitudes de choc (>= 0) : spread B (USD/MMBtu), fret (USD/jour), EUA (USD/t).
 *
 * # Validation
 * - validate(...) lève core::InvalidConfigError ; aucune valeur n'est bornée en silence.
 * - *_from_params(...) lisent une table "param,value" (clés du fichier config.csv)
 *   et valident le résultat.
 */

#include <map>
#include <string>

namespace dvb {
namespace config {

/// @brief Énergie de référence pour le dimensionnement de la couverture.
enum class HedgeEnergyBasis {
  MaxOfBoth,          ///< max(énergie livrée A, énergie livrée B) * coverage.
  StrongerDestination ///< énergie livrée de la destination au meilleur netback * coverage.
};

/// @brief Politique de couverture lorsque la décision est KEEP.
enum class KeepHedgePolicy {
  None,    ///< Aucune jambe émise (politique de référence).
  Reverse  ///< Jambes inversées : achat A, vente B.
};

/// @brief Règle de décision (immuable par appel).
struct DecisionRule {
  double basis_haircut_pct   = 0.05;
  double ops_buffer_usd      = 50000.0;
  double decision_buffer_usd = 500000.0;
  double coverage_pct        = 0.80;
  double lot_size_a          = 10000.0; ///< MMBtu par lot, benchmark A.
  double lot_size_b          = 10000.0; ///< MMBtu par lot, benchmark B.

  std::string benchmark_a = "TTF";
  std::string benchmark_b = "JKM";

  HedgeEnergyBasis hedge_basis = HedgeEnergyBasis::MaxOfBoth;
  KeepHedgePolicy  keep_policy = KeepHedgePolicy::None;
};

/// @brief Amplitudes des chocs de stress (valeurs absolues, signe porté par le scénario).
struct StressConfig {
  double spread_shock_usd      = 1.0;     ///< Choc sur le prix B (USD/MMBtu).
  double freight_shock_usd_day = 20000.0; ///< Choc sur le fret (USD/jour).
  double eua_shock_usd         = 10.0;    ///< Choc sur l'EUA (USD/tCO2).
};

/// @throws core::InvalidConfigError si un ratio est hors [0,1] ou un buffer / lot <= 0.
void validate(const DecisionRule& rule);

/// @throws core::InvalidConfigError si une amplitude est négative ou non finie.
void validate(const StressConfig& stress);

/// @brief Construit et valide une règle depuis la table de configuration.
/// Clés requises : DECISION_BUFFER_USD, OPS_BUFFER_USD, BASIS_ADJUSTMENT,
/// COVERAGE_PCT, TTF_LOT_MMBTU, JKM_LOT_MMBTU.
DecisionRule decision_rule_from_params(const std::map<std::string, double>& params);

/// @brief Construit et valide les chocs depuis la table de configuration.
/// Clés requises : STRESS_SPREAD_USD, STRESS_FREIGHT_USD_PER_DAY, STRESS_EUA_USD.
StressConfig stress_config_from_params(const std::map<std::string, double>& params);

/// @brief Vérifie la présence de toutes les clés requises puis les domaines.
/// @throws core::InvalidConfigError en listant les clés manquantes.
void validate_params(const std::map<std::string, double>& params);

const char* to_string(HedgeEnergyBasis b) noexcept;
const char* to_string(KeepHedgePolicy p) noexcept;

} // namespace config
} // namespace dvb
