#pragma once
/**
 * @file reference_data.hpp
 * @brief Données de référence statiques : routes, navires, paramètres carbone.
 *
 * # Contenu
 * - Route   : (port de chargement, port de déchargement, distance en milles nautiques).
 * - Vessel  : caractéristiques d'une classe de méthanier (capacité, vitesses, boil-off, conso).
 * - CarbonParams : table scalaire (prix EUA, facteurs CO2 par type de carburant, ...).
 *
 * # Domaines valides
 * - distance_nm >= 0
 * - boil_off_pct_per_day dans [0, 100)
 * - laden_speed_kn > 0, cargo_capacity_m3 > 0
 *
 * # Recherche
 * - Les routes sont indexées par la paire exacte (load_port, discharge_port),
 *   les navires par vessel_class. Une clé absente lève core::NotFoundError,
 *   une clé dupliquée à l'insertion lève core::InvalidConfigError.
 *
 * Les tables sont en lecture seule une fois construites et peuvent être partagées
 * entre évaluations concurrentes sans verrou.
 */

#include <cstddef>
#include <map>
#include <string>
#include <utility>

namespace dvb {
namespace market {

/// @brief Type de carburant brûlé pendant le voyage (sélectionne le facteur CO2).
enum class FuelType {
  VLSFO, ///< Fuel très basse teneur en soufre.
  LNG    ///< Boil-off utilisé comme carburant.
};

/// @return "VLSFO" ou "LNG".
const char* to_string(FuelType f) noexcept;

/// @brief Une ligne de la table des routes.
struct Route {
public:
  const std::string load_port;      ///< Port de chargement.
  const std::string discharge_port; ///< Port de déchargement.
  const double distance_nm;         ///< Distance (milles nautiques, >= 0).

  /// @throws core::InvalidConfigError si distance_nm < 0 ou non finie.
  Route(std::string load_port, std::string discharge_port, double distance_nm);
};

/// @brief Une classe de navire.
struct Vessel {
public:
  const std::string vessel_class;
  const double cargo_capacity_m3;            ///< Capacité de cuve (> 0).
  const double laden_speed_kn;               ///< Vitesse en charge (> 0).
  const double ballast_speed_kn;             ///< Vitesse sur lest (non modélisée).
  const double boil_off_pct_per_day;         ///< Boil-off en % par jour, dans [0, 100).
  const double fuel_consumption_tpd_laden;   ///< Consommation en charge (t/jour).
  const double fuel_consumption_tpd_ballast; ///< Consommation sur lest (t/jour).

  /// @throws core::InvalidConfigError si un champ est hors domaine.
  Vessel(std::string vessel_class,
         double cargo_capacity_m3,
         double laden_speed_kn,
         double ballast_speed_kn,
         double boil_off_pct_per_day,
         double fuel_consumption_tpd_laden,
         double fuel_consumption_tpd_ballast);
};

/// @brief Paramètres carbone (clé -> valeur), clés au format du fichier carbon_params.csv.
struct CarbonParams {
  static constexpr const char* kEuaPrice   = "EUA_price_USD_per_t";
  static constexpr const char* kCo2Vlsfo   = "CO2_factor_VLSFO_tCO2_per_t_fuel";
  static constexpr const char* kCo2Lng     = "CO2_factor_LNG_tCO2_per_t_fuel";

  std::map<std::string, double> values;

  /// @throws core::NotFoundError si la clé est absente.
  double value(const std::string& key) const;

  /// @return Facteur d'émission (tCO2 / t de carburant) pour le carburant donné.
  /// @throws core::NotFoundError si le facteur correspondant est absent.
  double co2_factor(FuelType fuel) const;
};

/// @brief Table des routes indexée par (load_port, discharge_port).
class RouteTable {
public:
  /// @throws core::InvalidConfigError si la paire existe déjà.
  void add(Route route);

  /// @throws core::NotFoundError si la paire est absente.
  const Route& find(const std::string& load_port, const std::string& discharge_port) const;

  bool contains(const std::string& load_port, const std::string& discharge_port) const;
  std::size_t size() const noexcept { return rows_.size(); }

private:
  std::map<std::pair<std::string, std::string>, Route> rows_;
};

/// @brief Table des navires indexée par vessel_class.
class VesselTable {
public:
  /// @throws core::InvalidConfigError si la classe existe déjà.
  void add(Vessel vessel);

  /// @throws core::NotFoundError si la classe est absente.
  const Vessel& find(const std::string& vessel_class) const;

  bool contains(const std::string& vessel_class) const;
  std::size_t size() const noexcept { return rows_.size(); }

private:
  std::map<std::string, Vessel> rows_;
};

/// @brief Ensemble des données statiques consommées par le pipeline.
struct ReferenceData {
  RouteTable routes;
  VesselTable vessels;
  CarbonParams carbon;
};

} // namespace market
} // namespace dvb
