#include <dvb/voyage/voyage_model.hpp>
#include <dvb/core/errors.hpp>

#include <cmath>

namespace dvb {
namespace voyage {

VoyageDetails compute_voyage(const market::Route& route,
                             const market::Vessel& vessel,
                             const market::CarbonParams& carbon,
                             const VoyageCosts& costs,
                             market::FuelType fuel,
                             double cargo_capacity_m3) {
  // 0 : capacité du navire ; négatif ou non fini : refusé
  if (!std::isfinite(cargo_capacity_m3) || cargo_capacity_m3 < 0.0) {
    throw core::InvalidConfigError("cargo_capacity_m3 must be >= 0 (0 = vessel capacity)");
  }
  const double capacity = (cargo_capacity_m3 > 0.0) ? cargo_capacity_m3
                                                    : vessel.cargo_capacity_m3;
  // facteur lu avant tout calcul : une clé manquante échoue tôt
  const double co2_factor = carbon.co2_factor(fuel);

  VoyageDetails v{};
  v.distance_nm = route.distance_nm;
  v.voyage_days = route.distance_nm / (vessel.laden_speed_kn * kHoursPerDay);

  // Boil-off proportionnel au temps de transit
  v.boil_off_m3        = capacity * (vessel.boil_off_pct_per_day / 100.0) * v.voyage_days;
  v.delivered_cargo_m3 = capacity - v.boil_off_m3;

  const double delivered_tonnes = v.delivered_cargo_m3 * kLngDensityTPerM3;
  v.delivered_energy_mmbtu      = delivered_tonnes * kEnergyContentMmbtuPerT;

  v.fuel_consumed_tonnes  = vessel.fuel_consumption_tpd_laden * v.voyage_days;
  v.fuel_cost_usd         = v.fuel_consumed_tonnes * costs.fuel_price_usd_t;
  v.time_charter_cost_usd = costs.freight_rate_usd_day * v.voyage_days;

  v.carbon_emissions_tco2 = v.fuel_consumed_tonnes * co2_factor;
  v.carbon_cost_usd       = v.carbon_emissions_tco2 * costs.eua_price_usd_t;

  v.total_voyage_cost_usd = v.fuel_cost_usd + v.time_charter_cost_usd + v.carbon_cost_usd;
  return v;
}

VoyageDetails compute_voyage(const market::ReferenceData& ref,
                             const std::string& load_port,
                             const std::string& discharge_port,
                             const std::string& vessel_class,
                             const VoyageCosts& costs,
                             market::FuelType fuel,
                             double cargo_capacity_m3) {
  const auto& route  = ref.routes.find(load_port, discharge_port);
  const auto& vessel = ref.vessels.find(vessel_class);
  return compute_voyage(route, vessel, ref.carbon, costs, fuel, cargo_capacity_m3);
}

} // namespace voyage
} // namespace dvb
