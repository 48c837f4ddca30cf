#pragma once
/**
 * @file decision_engine.hpp
 * @brief Règle de diversion DIVERT / KEEP et dimensionnement de la couverture.
 *
 * # Règle
 *   delta_raw = netback_b - netback_a                 (B = marché candidat)
 *   delta_adj = delta_raw * (1 - basis_haircut_pct) - ops_buffer_usd
 *   DIVERT  <=>  delta_adj >= decision_buffer_usd     (comparaison inclusive)
 *
 * # Couverture
 *   lots_x = floor(hedge_energy_mmbtu / lot_size_x)   (arrondi inférieur, jamais négatif)
 *   Un quotient >= 2^63 est saturé à INT64_MAX.
 *   - DIVERT : achat benchmark B, vente benchmark A.
 *   - KEEP   : aucune jambe (KeepHedgePolicy::None) ou jambes inversées (Reverse).
 *
 * Fonctions pures : aucun état interne, mêmes entrées => mêmes sorties.
 */

#include <cstdint>
#include <string>
#include <vector>

#include <dvb/config/decision_config.hpp>
#include <dvb/netback/netback.hpp>

namespace dvb {
namespace decision {

enum class Decision { Divert, Keep };

/// @return "DIVERT" ou "KEEP".
const char* to_string(Decision d) noexcept;

enum class Side { Buy, Sell };

/// @return "BUY" ou "SELL".
const char* to_string(Side s) noexcept;

/// @brief Une jambe de couverture papier.
struct HedgeLeg {
  Side side;
  std::string instrument; ///< Benchmark (ex : "JKM").
  std::int64_t lots;
};

struct DecisionResult {
  double delta_netback_raw_usd;
  double delta_netback_adj_usd;
  double basis_haircut_pct;
  double ops_buffer_usd;
  double decision_buffer_usd;
  Decision decision;
  double hedge_energy_mmbtu;
  std::int64_t lots_a;
  std::int64_t lots_b;
  std::vector<HedgeLeg> hedge_legs; ///< Vide si KEEP avec KeepHedgePolicy::None.
};

/**
 * @brief Applique la règle et dimensionne la couverture.
 * @throws core::InvalidConfigError si la règle est hors domaine (vérifié avant calcul).
 */
DecisionResult decide(double netback_a_usd,
                      double netback_b_usd,
                      double hedge_energy_mmbtu,
                      const config::DecisionRule& rule);

/// @brief Variante à scalaires explicites (benchmarks et politiques par défaut de DecisionRule).
DecisionResult decide(double netback_a_usd,
                      double netback_b_usd,
                      double hedge_energy_mmbtu,
                      double basis_haircut_pct,
                      double ops_buffer_usd,
                      double decision_buffer_usd,
                      double lot_size_a = 10000.0,
                      double lot_size_b = 10000.0);

/// @brief Nombre de lots entiers couverts : floor(energy / lot_size), borné à 0.
std::int64_t lots_for(double hedge_energy_mmbtu, double lot_size_mmbtu) noexcept;

/// @brief Énergie à couvrir selon rule.hedge_basis et rule.coverage_pct.
double hedge_energy(const netback::NetbackPair& pair, const config::DecisionRule& rule) noexcept;

} // namespace decision
} // namespace dvb
