#pragma once
#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include <dvb/market/market_data.hpp>
#include <dvb/market/reference_data.hpp>

namespace dvb::io {

// Lecteurs CSV des données de référence. En-tête obligatoire, insensible à la casse,
// synonymes de colonnes acceptés. Lignes vides et commentaires (#) ignorés.
// Les lignes invalides (champ manquant, valeur non finie, domaine violé, doublon)
// sont ignorées ; num_ignored/warnings sont optionnels pour diagnostic.
// Un fichier illisible renvoie un résultat vide et un warning.

// load_port,discharge_port,distance_nm
market::RouteTable
read_routes_csv(const std::string& path,
                std::size_t* num_ignored = nullptr,
                std::vector<std::string>* warnings = nullptr);

// vessel_class,cargo_capacity_m3,laden_speed_kn,ballast_speed_kn,
// boil_off_pct_per_day,fuel_consumption_tpd_laden,fuel_consumption_tpd_ballast
market::VesselTable
read_vessels_csv(const std::string& path,
                 std::size_t* num_ignored = nullptr,
                 std::vector<std::string>* warnings = nullptr);

// param,value (carbon_params.csv, config.csv). Dernière occurrence retenue si doublon.
std::map<std::string, double>
read_params_csv(const std::string& path,
                std::size_t* num_ignored = nullptr,
                std::vector<std::string>* warnings = nullptr);

// date,TTF_USD_MMBTU,JKM_USD_MMBTU,FREIGHT_USD_DAY,FUEL_USD_PER_T,EUA_USD_PER_TCO2
// Ordre du fichier conservé ; la date est tronquée à "YYYY-MM-DD".
std::vector<market::MarketObservation>
read_history_csv(const std::string& path,
                 std::size_t* num_ignored = nullptr,
                 std::vector<std::string>* warnings = nullptr);

// routes.csv + vessels.csv + carbon_params.csv d'un répertoire.
market::ReferenceData
load_reference_data(const std::string& dir,
                    std::vector<std::string>* warnings = nullptr);

} // namespace dvb::io
