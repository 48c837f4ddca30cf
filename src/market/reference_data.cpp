#include <dvb/market/reference_data.hpp>
#include <dvb/core/errors.hpp>

#include <cmath>

namespace dvb {
namespace market {

const char* to_string(FuelType f) noexcept {
  return f == FuelType::LNG ? "LNG" : "VLSFO";
}

Route::Route(std::string load, std::string discharge, double distance)
    : load_port(std::move(load)),
      discharge_port(std::move(discharge)),
      distance_nm(distance) {
  if (!std::isfinite(distance_nm) || distance_nm < 0.0) {
    throw core::InvalidConfigError("Route: distance_nm must be >= 0 (" +
                                   load_port + " -> " + discharge_port + ")");
  }
}

Vessel::Vessel(std::string cls,
               double capacity,
               double laden_speed,
               double ballast_speed,
               double boil_off_pct,
               double fuel_laden,
               double fuel_ballast)
    : vessel_class(std::move(cls)),
      cargo_capacity_m3(capacity),
      laden_speed_kn(laden_speed),
      ballast_speed_kn(ballast_speed),
      boil_off_pct_per_day(boil_off_pct),
      fuel_consumption_tpd_laden(fuel_laden),
      fuel_consumption_tpd_ballast(fuel_ballast) {
  if (!(cargo_capacity_m3 > 0.0)) {
    throw core::InvalidConfigError("Vessel " + vessel_class + ": cargo_capacity_m3 must be > 0");
  }
  if (!(laden_speed_kn > 0.0)) {
    throw core::InvalidConfigError("Vessel " + vessel_class + ": laden_speed_kn must be > 0");
  }
  if (!(boil_off_pct_per_day >= 0.0 && boil_off_pct_per_day < 100.0)) {
    throw core::InvalidConfigError("Vessel " + vessel_class + ": boil_off_pct_per_day must be in [0,100)");
  }
  if (!(fuel_consumption_tpd_laden >= 0.0)) {
    throw core::InvalidConfigError("Vessel " + vessel_class + ": fuel_consumption_tpd_laden must be >= 0");
  }
}

// --- CarbonParams -----------------------------------------------------------

double CarbonParams::value(const std::string& key) const {
  auto it = values.find(key);
  if (it == values.end()) {
    throw core::NotFoundError("Carbon parameter not found", key);
  }
  return it->second;
}

double CarbonParams::co2_factor(FuelType fuel) const {
  return value(fuel == FuelType::VLSFO ? kCo2Vlsfo : kCo2Lng);
}

// --- RouteTable -------------------------------------------------------------

void RouteTable::add(Route route) {
  auto key = std::make_pair(route.load_port, route.discharge_port);
  if (rows_.count(key)) {
    throw core::InvalidConfigError("RouteTable: duplicate route " +
                                   key.first + " -> " + key.second);
  }
  rows_.emplace(std::move(key), std::move(route));
}

const Route& RouteTable::find(const std::string& load_port,
                              const std::string& discharge_port) const {
  auto it = rows_.find(std::make_pair(load_port, discharge_port));
  if (it == rows_.end()) {
    throw core::NotFoundError("Route not found", load_port + " -> " + discharge_port);
  }
  return it->second;
}

bool RouteTable::contains(const std::string& load_port,
                          const std::string& discharge_port) const {
  return rows_.count(std::make_pair(load_port, discharge_port)) != 0;
}

// --- VesselTable ------------------------------------------------------------

void VesselTable::add(Vessel vessel) {
  if (rows_.count(vessel.vessel_class)) {
    throw core::InvalidConfigError("VesselTable: duplicate vessel class " + vessel.vessel_class);
  }
  std::string key = vessel.vessel_class;
  rows_.emplace(std::move(key), std::move(vessel));
}

const Vessel& VesselTable::find(const std::string& vessel_class) const {
  auto it = rows_.find(vessel_class);
  if (it == rows_.end()) {
    throw core::NotFoundError("Vessel class not found", vessel_class);
  }
  return it->second;
}

bool VesselTable::contains(const std::string& vessel_class) const {
  return rows_.count(vessel_class) != 0;
}

} // namespace market
} // namespace dvb
