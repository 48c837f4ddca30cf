#include <dvb/risk/stress.hpp>

#include <algorithm>
#include <limits>

namespace dvb {
namespace risk {

const char* scenario_name(ScenarioKind k) noexcept {
  switch (k) {
    case ScenarioKind::SpreadCollapse:  return "Spread Collapse";
    case ScenarioKind::SpreadWiden:     return "Spread Widen";
    case ScenarioKind::FreightSpike:    return "Freight Spike";
    case ScenarioKind::FreightDrop:     return "Freight Drop";
    case ScenarioKind::EuaSpike:        return "EUA Spike";
    case ScenarioKind::CombinedAdverse: return "Combined Adverse";
  }
  return "Unknown";
}

StressScenario make_scenario(ScenarioKind k, const config::StressConfig& cfg) noexcept {
  StressScenario s{k, scenario_name(k), 0.0, 0.0, 0.0};
  switch (k) {
    case ScenarioKind::SpreadCollapse:
      s.spread_shock_usd = -cfg.spread_shock_usd;
      break;
    case ScenarioKind::SpreadWiden:
      s.spread_shock_usd = cfg.spread_shock_usd;
      break;
    case ScenarioKind::FreightSpike:
      s.freight_shock_usd_day = cfg.freight_shock_usd_day;
      break;
    case ScenarioKind::FreightDrop:
      s.freight_shock_usd_day = -cfg.freight_shock_usd_day;
      break;
    case ScenarioKind::EuaSpike:
      s.eua_shock_usd = cfg.eua_shock_usd;
      break;
    case ScenarioKind::CombinedAdverse:
      s.spread_shock_usd      = -cfg.spread_shock_usd;
      s.freight_shock_usd_day = cfg.freight_shock_usd_day;
      s.eua_shock_usd         = cfg.eua_shock_usd;
      break;
  }
  return s;
}

market::MarketInputs apply(const StressScenario& s, const market::MarketInputs& base) noexcept {
  market::MarketInputs m = base;
  m.price_b              += s.spread_shock_usd;
  m.freight_rate_usd_day += s.freight_shock_usd_day;
  m.eua_price_usd_t      += s.eua_shock_usd;
  return m;
}

RiskPack run_stress_test(const decision::DecisionResult& base_result,
                         const market::ReferenceData& ref,
                         const netback::CargoRequest& cargo,
                         const market::MarketInputs& mkt,
                         const config::DecisionRule& rule,
                         const config::StressConfig& stress,
                         market::FuelType fuel) {
  // Paramètres vérifiés avant tout recalcul
  config::validate(rule);
  config::validate(stress);

  RiskPack pack;
  pack.base_result = base_result;
  pack.stress_results.reserve(kAllScenarios.size());

  double worst = std::numeric_limits<double>::infinity();
  for (ScenarioKind k : kAllScenarios) {
    const StressScenario sc = make_scenario(k, stress);
    const auto shocked      = apply(sc, mkt);

    const auto pair     = netback::compare(ref, cargo, shocked, fuel);
    const auto stressed = decision::decide(pair.a.netback_usd, pair.b.netback_usd,
                                           decision::hedge_energy(pair, rule), rule);

    StressResult r{sc,
                   base_result.delta_netback_adj_usd,
                   stressed.delta_netback_adj_usd,
                   stressed.delta_netback_adj_usd - base_result.delta_netback_adj_usd,
                   stressed.decision != base_result.decision,
                   base_result.decision,
                   stressed.decision};

    worst = std::min(worst, r.pnl_impact_usd);
    if (r.decision_change) pack.scenarios_causing_flip.push_back(sc.name);
    pack.stress_results.push_back(std::move(r));
  }
  pack.worst_case_pnl_impact = worst;
  return pack;
}

} // namespace risk
} // namespace dvb
