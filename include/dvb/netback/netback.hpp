#pragma once
/**
 * @file netback.hpp
 * @brief Netback par destination et comparaison A / B.
 *
 *   revenue_usd     = price_usd_mmbtu * delivered_energy_mmbtu
 *   netback_usd     = revenue_usd - total_voyage_cost_usd
 *   voyage_cost_usd = total_voyage_cost_usd - carbon_cost_usd   (hors carbone)
 *
 * Le coût carbone est exposé séparément pour permettre la décomposition de la marge.
 */

#include <string>

#include <dvb/market/market_data.hpp>
#include <dvb/market/reference_data.hpp>
#include <dvb/voyage/voyage_model.hpp>

namespace dvb {
namespace netback {

/// @brief Netback d'une destination.
struct NetbackResult {
  std::string destination;
  double price_usd_mmbtu;
  double delivered_energy_mmbtu;
  double revenue_usd;
  double voyage_cost_usd; ///< Coût total hors carbone.
  double carbon_cost_usd;
  double netback_usd;
  voyage::VoyageDetails voyage;
};

/// @brief Description de la cargaison et des deux destinations comparées.
struct CargoRequest {
  std::string load_port;
  std::string port_a;          ///< Destination actuelle (ex : Rotterdam).
  std::string port_b;          ///< Destination candidate (ex : Tokyo).
  std::string vessel_class;
  double cargo_capacity_m3{0.0}; ///< 0 : capacité du navire ; négatif refusé.
  std::string label_a{"Europe"};
  std::string label_b{"Asia"};
};

/// @brief Résultats (A, B) dans cet ordre.
struct NetbackPair {
  NetbackResult a;
  NetbackResult b;
};

/// @brief Netback d'une destination à partir d'un voyage déjà calculé.
NetbackResult compute_netback(const std::string& destination,
                              double price_usd_mmbtu,
                              const voyage::VoyageDetails& voyage);

/**
 * @brief Calcule les netbacks origine -> A et origine -> B.
 *
 * Même navire, carburant et paramètres carbone pour les deux jambes ;
 * distance et prix propres à chaque destination.
 * @throws core::NotFoundError si une route ou la classe de navire est absente.
 */
NetbackPair compare(const market::ReferenceData& ref,
                    const CargoRequest& cargo,
                    const market::MarketInputs& mkt,
                    market::FuelType fuel = market::FuelType::VLSFO);

} // namespace netback
} // namespace dvb
