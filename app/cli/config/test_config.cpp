#include "dvb/config/decision_config.hpp"
#include "dvb/core/errors.hpp"
#include <cassert>
#include <iostream>
#include <map>
#include <string>

using namespace dvb;

static const std::map<std::string, double> kValid{
  {"DECISION_BUFFER_USD", 250000.0},
  {"OPS_BUFFER_USD", 150000.0},
  {"BASIS_ADJUSTMENT", 0.05},
  {"COVERAGE_PCT", 0.80},
  {"TTF_LOT_MMBTU", 10000.0},
  {"JKM_LOT_MMBTU", 10000.0},
  {"STRESS_SPREAD_USD", 1.0},
  {"STRESS_FREIGHT_USD_PER_DAY", 20000.0},
  {"STRESS_EUA_USD", 10.0},
};

static std::string invalid_message(const std::map<std::string, double>& p) {
  try { config::validate_params(p); }
  catch (const core::InvalidConfigError& e) { return e.what(); }
  return {};
}

int main() {
  // 1) Table complète : valide, conversion fidèle
  config::validate_params(kValid);
  const auto rule = config::decision_rule_from_params(kValid);
  assert(rule.decision_buffer_usd == 250000.0);
  assert(rule.ops_buffer_usd == 150000.0);
  assert(rule.basis_haircut_pct == 0.05);
  assert(rule.coverage_pct == 0.80);
  assert(rule.lot_size_a == 10000.0 && rule.lot_size_b == 10000.0);
  assert(rule.hedge_basis == config::HedgeEnergyBasis::MaxOfBoth);
  assert(rule.keep_policy == config::KeepHedgePolicy::None);

  const auto stress = config::stress_config_from_params(kValid);
  assert(stress.spread_shock_usd == 1.0);
  assert(stress.freight_shock_usd_day == 20000.0);
  assert(stress.eua_shock_usd == 10.0);

  // 2) Décote saisie en pourcent (5.0 au lieu de 0.05) refusée
  auto pct = kValid;
  pct["BASIS_ADJUSTMENT"] = 5.0;
  assert(invalid_message(pct).find("BASIS_ADJUSTMENT") != std::string::npos);

  // 3) Clés manquantes toutes listées
  auto missing = kValid;
  missing.erase("COVERAGE_PCT");
  missing.erase("STRESS_EUA_USD");
  const auto msg = invalid_message(missing);
  assert(msg.find("COVERAGE_PCT") != std::string::npos);
  assert(msg.find("STRESS_EUA_USD") != std::string::npos);

  // 4) Domaines
  auto zero_lot = kValid;
  zero_lot["JKM_LOT_MMBTU"] = 0.0;
  assert(!invalid_message(zero_lot).empty());
  auto neg_shock = kValid;
  neg_shock["STRESS_FREIGHT_USD_PER_DAY"] = -1.0;
  assert(!invalid_message(neg_shock).empty());
  auto zero_shock = kValid;
  zero_shock["STRESS_SPREAD_USD"] = 0.0; // choc nul autorisé
  assert(invalid_message(zero_shock).empty());

  // 5) Validation directe des structs
  config::DecisionRule r;
  config::validate(r); // valeurs par défaut valides
  r.coverage_pct = 1.5;
  bool thrown = false;
  try { config::validate(r); } catch (const core::InvalidConfigError&) { thrown = true; }
  assert(thrown);

  config::StressConfig s;
  config::validate(s);

  assert(std::string(config::to_string(config::HedgeEnergyBasis::StrongerDestination)) == "stronger_destination");
  assert(std::string(config::to_string(config::KeepHedgePolicy::Reverse)) == "reverse");

  std::cout << "Config OK.\n";
  return 0;
}
