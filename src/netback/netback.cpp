#include <dvb/netback/netback.hpp>

namespace dvb {
namespace netback {

NetbackResult compute_netback(const std::string& destination,
                              double price_usd_mmbtu,
                              const voyage::VoyageDetails& voyage) {
  NetbackResult r{};
  r.destination            = destination;
  r.price_usd_mmbtu        = price_usd_mmbtu;
  r.delivered_energy_mmbtu = voyage.delivered_energy_mmbtu;
  r.revenue_usd            = price_usd_mmbtu * voyage.delivered_energy_mmbtu;
  r.voyage_cost_usd        = voyage.total_voyage_cost_usd - voyage.carbon_cost_usd;
  r.carbon_cost_usd        = voyage.carbon_cost_usd;
  // le carbone est déjà inclus dans total_voyage_cost_usd
  r.netback_usd            = r.revenue_usd - voyage.total_voyage_cost_usd;
  r.voyage                 = voyage;
  return r;
}

NetbackPair compare(const market::ReferenceData& ref,
                    const CargoRequest& cargo,
                    const market::MarketInputs& mkt,
                    market::FuelType fuel) {
  const voyage::VoyageCosts costs{mkt.freight_rate_usd_day,
                                  mkt.fuel_price_usd_t,
                                  mkt.eua_price_usd_t};

  const auto leg_a = voyage::compute_voyage(ref, cargo.load_port, cargo.port_a,
                                            cargo.vessel_class, costs, fuel,
                                            cargo.cargo_capacity_m3);
  const auto leg_b = voyage::compute_voyage(ref, cargo.load_port, cargo.port_b,
                                            cargo.vessel_class, costs, fuel,
                                            cargo.cargo_capacity_m3);

  return NetbackPair{compute_netback(cargo.label_a, mkt.price_a, leg_a),
                     compute_netback(cargo.label_b, mkt.price_b, leg_b)};
}

} // namespace netback
} // namespace dvb
