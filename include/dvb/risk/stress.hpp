#pragma once
/**
 * @file stress.hpp
 * @brief Batterie fixe de scénarios de stress sur la décision de diversion.
 *
 * # Scénarios (noms contractuels)
 *   SpreadCollapse   : prix B - spread
 *   SpreadWiden      : prix B + spread
 *   FreightSpike     : fret + freight
 *   FreightDrop      : fret - freight
 *   EuaSpike         : EUA + eua
 *   CombinedAdverse  : prix B - spread, fret + freight, EUA + eua
 *
 * # Par scénario
 * - Chocs additifs sur les entrées, recalcul des deux netbacks et d'une décision fraîche
 *   avec la même règle que le cas de base.
 * - pnl_impact_usd  = stressed_delta_adj - base_delta_adj
 * - decision_change = stressed_decision != base_decision
 *
 * # Agrégats
 * - worst_case_pnl_impact = min(pnl_impact_usd)
 * - scenarios_causing_flip : noms des scénarios qui font basculer la décision (ordre fixe).
 *
 * Sans état ; les six recalculs sont indépendants.
 */

#include <array>
#include <string>
#include <vector>

#include <dvb/config/decision_config.hpp>
#include <dvb/decision/decision_engine.hpp>
#include <dvb/market/market_data.hpp>
#include <dvb/market/reference_data.hpp>
#include <dvb/netback/netback.hpp>

namespace dvb {
namespace risk {

enum class ScenarioKind {
  SpreadCollapse,
  SpreadWiden,
  FreightSpike,
  FreightDrop,
  EuaSpike,
  CombinedAdverse
};

/// @brief Les six scénarios, dans l'ordre du rapport.
inline constexpr std::array<ScenarioKind, 6> kAllScenarios = {
  ScenarioKind::SpreadCollapse, ScenarioKind::SpreadWiden,
  ScenarioKind::FreightSpike,   ScenarioKind::FreightDrop,
  ScenarioKind::EuaSpike,       ScenarioKind::CombinedAdverse
};

/// @return Nom affiché ("Spread Collapse", ...).
const char* scenario_name(ScenarioKind k) noexcept;

/// @brief Triplet de chocs additifs nommé.
struct StressScenario {
  ScenarioKind kind;
  std::string name;
  double spread_shock_usd;      ///< Ajouté au prix B.
  double freight_shock_usd_day; ///< Ajouté au fret.
  double eua_shock_usd;         ///< Ajouté au prix EUA.
};

/// @brief Instancie un scénario avec les amplitudes de la configuration.
StressScenario make_scenario(ScenarioKind k, const config::StressConfig& cfg) noexcept;

/// @brief Applique les chocs d'un scénario aux entrées de marché.
market::MarketInputs apply(const StressScenario& s, const market::MarketInputs& base) noexcept;

struct StressResult {
  StressScenario scenario;
  double base_delta_netback_adj;
  double stressed_delta_netback_adj;
  double pnl_impact_usd;
  bool decision_change;
  decision::Decision base_decision;
  decision::Decision stressed_decision;
};

struct RiskPack {
  decision::DecisionResult base_result;
  std::vector<StressResult> stress_results; ///< Un résultat par scénario, ordre kAllScenarios.
  double worst_case_pnl_impact;
  std::vector<std::string> scenarios_causing_flip;
};

/**
 * @brief Rejoue la comparaison + décision sous chacun des six scénarios.
 * @param base_result Décision du cas de base (référence pour pnl_impact et bascule).
 * @throws core::InvalidConfigError si la règle ou les chocs sont hors domaine.
 * @throws core::NotFoundError si une route ou le navire est absent.
 */
RiskPack run_stress_test(const decision::DecisionResult& base_result,
                         const market::ReferenceData& ref,
                         const netback::CargoRequest& cargo,
                         const market::MarketInputs& mkt,
                         const config::DecisionRule& rule,
                         const config::StressConfig& stress,
                         market::FuelType fuel = market::FuelType::VLSFO);

} // namespace risk
} // namespace dvb
