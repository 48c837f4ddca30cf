#include <dvb/decision/decision_engine.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

namespace dvb {
namespace decision {

const char* to_string(Decision d) noexcept {
  return d == Decision::Divert ? "DIVERT" : "KEEP";
}

const char* to_string(Side s) noexcept {
  return s == Side::Buy ? "BUY" : "SELL";
}

std::int64_t lots_for(double hedge_energy_mmbtu, double lot_size_mmbtu) noexcept {
  const double q = std::floor(hedge_energy_mmbtu / lot_size_mmbtu);
  if (!(q > 0.0)) return 0; // énergie négative (cargaison dégénérée) ou NaN
  // saturation : au-delà de 2^63 (ou +inf) la conversion en int64 n'est pas définie
  constexpr double kInt64Bound = 9223372036854775808.0; // 2^63
  if (q >= kInt64Bound) return std::numeric_limits<std::int64_t>::max();
  return static_cast<std::int64_t>(q);
}

double hedge_energy(const netback::NetbackPair& pair, const config::DecisionRule& rule) noexcept {
  double base = 0.0;
  switch (rule.hedge_basis) {
    case config::HedgeEnergyBasis::MaxOfBoth:
      base = std::max(pair.a.delivered_energy_mmbtu, pair.b.delivered_energy_mmbtu);
      break;
    case config::HedgeEnergyBasis::StrongerDestination:
      // égalité : B, la destination candidate
      base = (pair.b.netback_usd >= pair.a.netback_usd) ? pair.b.delivered_energy_mmbtu
                                                        : pair.a.delivered_energy_mmbtu;
      break;
  }
  return base * rule.coverage_pct;
}

DecisionResult decide(double netback_a_usd,
                      double netback_b_usd,
                      double hedge_energy_mmbtu,
                      const config::DecisionRule& rule) {
  config::validate(rule);

  DecisionResult r{};
  r.basis_haircut_pct   = rule.basis_haircut_pct;
  r.ops_buffer_usd      = rule.ops_buffer_usd;
  r.decision_buffer_usd = rule.decision_buffer_usd;

  r.delta_netback_raw_usd = netback_b_usd - netback_a_usd;
  r.delta_netback_adj_usd = r.delta_netback_raw_usd * (1.0 - rule.basis_haircut_pct)
                          - rule.ops_buffer_usd;

  r.decision = (r.delta_netback_adj_usd >= rule.decision_buffer_usd) ? Decision::Divert
                                                                     : Decision::Keep;

  r.hedge_energy_mmbtu = hedge_energy_mmbtu;
  r.lots_a = lots_for(hedge_energy_mmbtu, rule.lot_size_a);
  r.lots_b = lots_for(hedge_energy_mmbtu, rule.lot_size_b);

  if (r.decision == Decision::Divert) {
    r.hedge_legs.push_back({Side::Buy,  rule.benchmark_b, r.lots_b});
    r.hedge_legs.push_back({Side::Sell, rule.benchmark_a, r.lots_a});
  } else if (rule.keep_policy == config::KeepHedgePolicy::Reverse) {
    r.hedge_legs.push_back({Side::Buy,  rule.benchmark_a, r.lots_a});
    r.hedge_legs.push_back({Side::Sell, rule.benchmark_b, r.lots_b});
  }
  return r;
}

DecisionResult decide(double netback_a_usd,
                      double netback_b_usd,
                      double hedge_energy_mmbtu,
                      double basis_haircut_pct,
                      double ops_buffer_usd,
                      double decision_buffer_usd,
                      double lot_size_a,
                      double lot_size_b) {
  config::DecisionRule rule;
  rule.basis_haircut_pct   = basis_haircut_pct;
  rule.ops_buffer_usd      = ops_buffer_usd;
  rule.decision_buffer_usd = decision_buffer_usd;
  rule.lot_size_a          = lot_size_a;
  rule.lot_size_b          = lot_size_b;
  return decide(netback_a_usd, netback_b_usd, hedge_energy_mmbtu, rule);
}

} // namespace decision
} // namespace dvb
