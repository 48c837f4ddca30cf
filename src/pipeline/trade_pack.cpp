#include <dvb/pipeline/trade_pack.hpp>

namespace dvb {
namespace pipeline {

namespace {

LegSummary summarize(const netback::NetbackResult& nb, const std::string& port) {
  return LegSummary{nb.destination,
                    port,
                    nb.netback_usd,
                    nb.revenue_usd,
                    nb.voyage_cost_usd,
                    nb.carbon_cost_usd,
                    nb.delivered_energy_mmbtu,
                    nb.voyage.voyage_days};
}

} // namespace

TradePack run_trade_decision(const market::ReferenceData& ref,
                             const netback::CargoRequest& cargo,
                             const market::MarketInputs& mkt,
                             const config::DecisionRule& rule,
                             market::FuelType fuel) {
  config::validate(rule); // avant tout calcul de voyage

  const auto pair = netback::compare(ref, cargo, mkt, fuel);
  auto dec = decision::decide(pair.a.netback_usd, pair.b.netback_usd,
                              decision::hedge_energy(pair, rule), rule);

  return TradePack{TradeInputs{cargo, mkt, rule, fuel},
                   summarize(pair.a, cargo.port_a),
                   summarize(pair.b, cargo.port_b),
                   std::move(dec)};
}

std::vector<backtest::DailyDecision>
evaluate_history(const market::ReferenceData& ref,
                 const netback::CargoRequest& cargo,
                 const std::vector<market::MarketObservation>& observations,
                 const config::DecisionRule& rule,
                 market::FuelType fuel) {
  std::vector<backtest::DailyDecision> rows;
  rows.reserve(observations.size());
  for (const auto& obs : observations) {
    const auto pack = run_trade_decision(ref, cargo, obs.inputs, rule, fuel);
    rows.push_back({obs.date,
                    pack.decision.decision,
                    pack.decision.delta_netback_raw_usd,
                    pack.decision.delta_netback_adj_usd,
                    pack.leg_a.netback_usd,
                    pack.leg_b.netback_usd});
  }
  return rows;
}

} // namespace pipeline
} // namespace dvb
