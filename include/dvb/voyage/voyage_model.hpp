#pragma once
/**
 * @file voyage_model.hpp
 * @brief Modèle de voyage (jambe en charge) : durée, boil-off, énergie livrée, coûts.
 *
 * # Formules
 *   voyage_days            = distance_nm / (laden_speed_kn * 24)
 *   boil_off_m3            = capacity * (boil_off_pct_per_day / 100) * voyage_days
 *   delivered_cargo_m3     = capacity - boil_off_m3
 *   delivered_energy_mmbtu = delivered_cargo_m3 * 0.45 (t/m3) * 52 (MMBtu/t)
 *   fuel_consumed_tonnes   = fuel_consumption_tpd_laden * voyage_days
 *   fuel_cost_usd          = fuel_consumed_tonnes * fuel_price_usd_t
 *   time_charter_cost_usd  = freight_rate_usd_day * voyage_days
 *   carbon_cost_usd        = fuel_consumed_tonnes * co2_factor(fuel) * eua_price_usd_t
 *   total_voyage_cost_usd  = fuel + time charter + carbon
 *
 * # Cas dégénérés
 * - Un navire trop lent sur une route trop longue peut donner un boil-off supérieur à la
 *   capacité, donc une cargaison / énergie livrée négative. La valeur est renvoyée telle
 *   quelle (pas de plancher à 0) : elle signale un problème de données en amont.
 *
 * # Périmètre
 * - Seule la jambe en charge est modélisée (pas de retour sur lest).
 */

#include <string>

#include <dvb/market/reference_data.hpp>

namespace dvb {
namespace voyage {

inline constexpr double kLngDensityTPerM3       = 0.45; ///< Densité GNL (t/m3).
inline constexpr double kEnergyContentMmbtuPerT = 52.0; ///< Contenu énergétique (MMBtu/t).
inline constexpr double kHoursPerDay            = 24.0;

/// @brief Coûts unitaires d'une évaluation (fret, carburant, carbone).
struct VoyageCosts {
  double freight_rate_usd_day{0.0};
  double fuel_price_usd_t{0.0};
  double eua_price_usd_t{0.0};
};

/// @brief Résultat d'un calcul de voyage (valeur immuable, recalculée à chaque appel).
struct VoyageDetails {
  double distance_nm;
  double voyage_days;
  double boil_off_m3;
  double delivered_cargo_m3;     ///< Peut être négatif (voir cas dégénérés).
  double delivered_energy_mmbtu; ///< Peut être négatif (voir cas dégénérés).
  double fuel_consumed_tonnes;
  double fuel_cost_usd;
  double time_charter_cost_usd;
  double carbon_emissions_tco2;
  double carbon_cost_usd;
  double total_voyage_cost_usd;
};

/**
 * @brief Calcule un voyage pour une route et un navire donnés.
 * @param route             Route (distance).
 * @param vessel            Classe de navire (vitesse, boil-off, consommation).
 * @param carbon            Paramètres carbone (facteur CO2 par carburant).
 * @param costs             Fret, carburant, EUA.
 * @param fuel              Carburant brûlé (sélectionne le facteur CO2).
 * @param cargo_capacity_m3 Volume chargé ; 0 = capacité du navire.
 * @throws core::NotFoundError si le facteur CO2 du carburant est absent.
 * @throws core::InvalidConfigError si cargo_capacity_m3 est négatif ou non fini.
 */
VoyageDetails compute_voyage(const market::Route& route,
                             const market::Vessel& vessel,
                             const market::CarbonParams& carbon,
                             const VoyageCosts& costs,
                             market::FuelType fuel = market::FuelType::VLSFO,
                             double cargo_capacity_m3 = 0.0);

/**
 * @brief Variante par clés : recherche la route et le navire dans les tables.
 * @throws core::NotFoundError si la paire de ports ou la classe de navire est absente.
 */
VoyageDetails compute_voyage(const market::ReferenceData& ref,
                             const std::string& load_port,
                             const std::string& discharge_port,
                             const std::string& vessel_class,
                             const VoyageCosts& costs,
                             market::FuelType fuel = market::FuelType::VLSFO,
                             double cargo_capacity_m3 = 0.0);

} // namespace voyage
} // namespace dvb
