#include <dvb/market/market_data.hpp>
#include <dvb/core/errors.hpp>

#include <initializer_list>

namespace {

double required(const std::map<std::string, double>& cfg, const char* key) {
  auto it = cfg.find(key);
  if (it == cfg.end()) {
    throw dvb::core::InvalidConfigError(std::string("Missing config key: ") + key);
  }
  return it->second;
}

double optional_or(const std::map<std::string, double>& cfg, const char* key, double fallback) {
  auto it = cfg.find(key);
  return it == cfg.end() ? fallback : it->second;
}

} // namespace

namespace dvb {
namespace market {

MarketSnapshot make_proxy_snapshot(const std::map<std::string, double>& cfg,
                                   const std::string& asof) {
  MarketSnapshot snap;
  snap.asof = asof;

  const double ttf = required(cfg, "TTF_USD_MMBTU");
  const double eua = required(cfg, "EUA_USD_PER_TCO2");

  // JKM proxy = TTF + prime explicite, sauf si JKM est fourni directement
  const double premium = optional_or(cfg, "JKM_PREMIUM_USD_PER_MMBTU", 0.0);
  const double jkm     = optional_or(cfg, "JKM_USD_MMBTU", ttf + premium);

  const double freight_base = required(cfg, "FREIGHT_USD_DAY");
  const double mult         = optional_or(cfg, "FREIGHT_REGIME_MULTIPLIER", 1.0);

  snap.inputs.price_a              = ttf;
  snap.inputs.price_b              = jkm;
  snap.inputs.freight_rate_usd_day = freight_base * mult;
  snap.inputs.fuel_price_usd_t     = required(cfg, "FUEL_USD_PER_T");
  snap.inputs.eua_price_usd_t      = eua;

  for (const char* k : {"TTF", "JKM", "FREIGHT", "FUEL", "EUA"}) {
    snap.provenance[k] = "proxy";
  }
  return snap;
}

} // namespace market
} // namespace dvb
