#include "dvb/core/errors.hpp"
#include "dvb/market/market_data.hpp"
#include "dvb/pipeline/trade_pack.hpp"
#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>
#include <initializer_list>
#include <map>
#include <string>
#include <vector>

using namespace dvb;

static market::ReferenceData make_ref() {
  market::ReferenceData ref;
  ref.routes.add(market::Route("US_Gulf", "Rotterdam", 5000.0));
  ref.routes.add(market::Route("US_Gulf", "Tokyo", 9500.0));
  ref.vessels.add(market::Vessel("TFDE", 174000.0, 19.5, 19.5, 0.10, 130.0, 130.0));
  ref.carbon.values[market::CarbonParams::kCo2Vlsfo] = 3.114;
  return ref;
}

int main() {
  const auto ref = make_ref();
  const netback::CargoRequest cargo{"US_Gulf", "Rotterdam", "Tokyo", "TFDE", 174000.0};

  // 1) Snapshot proxy : JKM = TTF + prime, fret * multiplicateur
  const std::map<std::string, double> cfg{
    {"TTF_USD_MMBTU", 35.69}, {"JKM_PREMIUM_USD_PER_MMBTU", 2.75},
    {"FREIGHT_USD_DAY", 85000.0}, {"FREIGHT_REGIME_MULTIPLIER", 1.2},
    {"FUEL_USD_PER_T", 583.0}, {"EUA_USD_PER_TCO2", 74.40}};
  const auto snap = market::make_proxy_snapshot(cfg, "2024-06-03");
  assert(std::abs(snap.inputs.price_b - 38.44) < 1e-12);
  assert(std::abs(snap.inputs.freight_rate_usd_day - 102000.0) < 1e-9);
  assert(snap.asof == "2024-06-03");
  assert(snap.provenance.size() == 5 && snap.provenance.at("JKM") == "proxy");

  auto direct = cfg;
  direct["JKM_USD_MMBTU"] = 40.0; // prix explicite prioritaire sur la prime
  assert(market::make_proxy_snapshot(direct).inputs.price_b == 40.0);

  auto missing = cfg;
  missing.erase("FUEL_USD_PER_T");
  bool thrown = false;
  try { (void)market::make_proxy_snapshot(missing); }
  catch (const core::InvalidConfigError&) { thrown = true; }
  assert(thrown);

  // 2) Trade pack : identités entre jambes et décision
  const market::MarketInputs mkt{35.69, 38.44, 85000.0, 583.0, 74.40};
  config::DecisionRule rule;
  rule.decision_buffer_usd = 250000.0;
  rule.ops_buffer_usd      = 150000.0;
  const auto pack = pipeline::run_trade_decision(ref, cargo, mkt, rule);

  assert(pack.leg_a.port == "Rotterdam" && pack.leg_b.port == "Tokyo");
  assert(pack.leg_a.destination == "Europe" && pack.leg_b.destination == "Asia");
  const auto& d = pack.decision;
  assert(std::abs(d.delta_netback_raw_usd - (pack.leg_b.netback_usd - pack.leg_a.netback_usd)) < 1e-6);
  assert(std::abs(d.delta_netback_adj_usd - (d.delta_netback_raw_usd * 0.95 - 150000.0)) < 1e-6);
  for (const auto* leg : {&pack.leg_a, &pack.leg_b}) {
    assert(std::abs(leg->netback_usd - (leg->revenue_usd - leg->voyage_cost_usd - leg->carbon_cost_usd)) < 1e-6);
  }
  assert(d.decision == decision::Decision::Divert);
  assert(std::abs(d.hedge_energy_mmbtu
                  - 0.8 * std::max(pack.leg_a.delivered_energy_mmbtu, pack.leg_b.delivered_energy_mmbtu)) < 1e-6);
  assert(d.hedge_legs.size() == 2 && d.hedge_legs[0].instrument == "JKM");
  assert(pack.inputs.cargo.vessel_class == "TFDE");

  // règle invalide détectée avant le calcul des voyages (même route absente)
  config::DecisionRule bad = rule;
  bad.coverage_pct = 80.0;
  netback::CargoRequest nowhere = cargo;
  nowhere.port_b = "Nowhere";
  thrown = false;
  try { (void)pipeline::run_trade_decision(ref, nowhere, mkt, bad); }
  catch (const core::InvalidConfigError&) { thrown = true; }
  assert(thrown);

  thrown = false;
  try { (void)pipeline::run_trade_decision(ref, nowhere, mkt, rule); }
  catch (const core::NotFoundError& e) { thrown = true; assert(e.key() == "US_Gulf -> Nowhere"); }
  assert(thrown);

  // 3) Historique : une ligne par observation, même résultat que l'appel unitaire
  std::vector<market::MarketObservation> obs{
    {"2024-01-02", mkt},
    {"2024-01-03", {35.69, 35.69, 85000.0, 583.0, 74.40}},
  };
  const auto rows = pipeline::evaluate_history(ref, cargo, obs, rule);
  assert(rows.size() == 2);
  assert(rows[0].date == "2024-01-02");
  assert(rows[0].decision == decision::Decision::Divert);
  assert(rows[0].delta_netback_adj_usd == d.delta_netback_adj_usd);
  assert(rows[0].netback_b_usd == pack.leg_b.netback_usd);
  // prix égaux : voyage long pénalisant -> KEEP
  assert(rows[1].decision == decision::Decision::Keep);
  assert(rows[1].delta_netback_raw_usd < 0.0);

  std::cout << "Trade pack OK. Decision=" << decision::to_string(d.decision)
            << " adj=" << d.delta_netback_adj_usd << "\n";
  return 0;
}
