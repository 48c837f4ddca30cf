#include <dvb/config/decision_config.hpp>
#include <dvb/core/errors.hpp>

#include <cmath>
#include <initializer_list>
#include <vector>

namespace {

using dvb::core::InvalidConfigError;

const char* const kRequiredKeys[] = {
  "DECISION_BUFFER_USD",
  "OPS_BUFFER_USD",
  "BASIS_ADJUSTMENT",
  "COVERAGE_PCT",
  "TTF_LOT_MMBTU",
  "JKM_LOT_MMBTU",
  "STRESS_SPREAD_USD",
  "STRESS_FREIGHT_USD_PER_DAY",
  "STRESS_EUA_USD",
};

void check_fraction(double v, const char* name) {
  if (!(v >= 0.0 && v <= 1.0)) {
    throw InvalidConfigError(std::string(name) + " must be in [0,1]");
  }
}

void check_positive(double v, const char* name) {
  if (!(v > 0.0) || !std::isfinite(v)) {
    throw InvalidConfigError(std::string(name) + " must be > 0");
  }
}

void check_non_negative(double v, const char* name) {
  if (!(v >= 0.0) || !std::isfinite(v)) {
    throw InvalidConfigError(std::string(name) + " must be >= 0");
  }
}

double at(const std::map<std::string, double>& params, const char* key) {
  auto it = params.find(key);
  if (it == params.end()) {
    throw InvalidConfigError(std::string("Missing config key: ") + key);
  }
  return it->second;
}

} // namespace

namespace dvb {
namespace config {

void validate(const DecisionRule& rule) {
  check_fraction(rule.basis_haircut_pct, "basis_haircut_pct");
  check_fraction(rule.coverage_pct, "coverage_pct");
  check_positive(rule.ops_buffer_usd, "ops_buffer_usd");
  check_positive(rule.decision_buffer_usd, "decision_buffer_usd");
  check_positive(rule.lot_size_a, "lot_size_a");
  check_positive(rule.lot_size_b, "lot_size_b");
}

void validate(const StressConfig& stress) {
  check_non_negative(stress.spread_shock_usd, "spread_shock_usd");
  check_non_negative(stress.freight_shock_usd_day, "freight_shock_usd_day");
  check_non_negative(stress.eua_shock_usd, "eua_shock_usd");
}

void validate_params(const std::map<std::string, double>& params) {
  std::vector<std::string> missing;
  for (const char* k : kRequiredKeys) {
    if (!params.count(k)) missing.emplace_back(k);
  }
  if (!missing.empty()) {
    std::string msg = "Missing config keys:";
    for (const auto& k : missing) msg += " " + k;
    throw InvalidConfigError(msg);
  }
  // les messages reprennent les noms de clés du fichier
  check_fraction(at(params, "BASIS_ADJUSTMENT"), "BASIS_ADJUSTMENT");
  check_fraction(at(params, "COVERAGE_PCT"), "COVERAGE_PCT");
  for (const char* k : {"DECISION_BUFFER_USD", "OPS_BUFFER_USD", "TTF_LOT_MMBTU", "JKM_LOT_MMBTU"}) {
    check_positive(at(params, k), k);
  }
  for (const char* k : {"STRESS_SPREAD_USD", "STRESS_FREIGHT_USD_PER_DAY", "STRESS_EUA_USD"}) {
    check_non_negative(at(params, k), k);
  }
}

DecisionRule decision_rule_from_params(const std::map<std::string, double>& params) {
  DecisionRule rule;
  rule.decision_buffer_usd = at(params, "DECISION_BUFFER_USD");
  rule.ops_buffer_usd      = at(params, "OPS_BUFFER_USD");
  rule.basis_haircut_pct   = at(params, "BASIS_ADJUSTMENT");
  rule.coverage_pct        = at(params, "COVERAGE_PCT");
  rule.lot_size_a          = at(params, "TTF_LOT_MMBTU");
  rule.lot_size_b          = at(params, "JKM_LOT_MMBTU");
  validate(rule);
  return rule;
}

StressConfig stress_config_from_params(const std::map<std::string, double>& params) {
  StressConfig s;
  s.spread_shock_usd      = at(params, "STRESS_SPREAD_USD");
  s.freight_shock_usd_day = at(params, "STRESS_FREIGHT_USD_PER_DAY");
  s.eua_shock_usd         = at(params, "STRESS_EUA_USD");
  validate(s);
  return s;
}

const char* to_string(HedgeEnergyBasis b) noexcept {
  return b == HedgeEnergyBasis::MaxOfBoth ? "max_of_both" : "stronger_destination";
}

const char* to_string(KeepHedgePolicy p) noexcept {
  return p == KeepHedgePolicy::None ? "none" : "reverse";
}

} // namespace config
} // namespace dvb
