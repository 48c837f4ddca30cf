#pragma once
/**
 * @file trade_pack.hpp
 * @brief Pipeline en un appel : netbacks A/B -> énergie couverte -> décision -> trade pack.
 *
 * Le TradePack est un enregistrement imbriqué typé (entrées, résumé par destination,
 * décision, jambes de couverture) destiné aux collaborateurs (CLI, rapports).
 *
 * evaluate_history() rejoue le pipeline sur chaque observation historique et produit
 * les lignes consommées par backtest::run_backtest(). Chaque ligne est indépendante.
 */

#include <string>
#include <vector>

#include <dvb/backtest/backtest.hpp>
#include <dvb/config/decision_config.hpp>
#include <dvb/decision/decision_engine.hpp>
#include <dvb/market/market_data.hpp>
#include <dvb/market/reference_data.hpp>
#include <dvb/netback/netback.hpp>

namespace dvb {
namespace pipeline {

/// @brief Résumé d'une destination pour l'affichage et les rapports.
struct LegSummary {
  std::string destination;
  std::string port;
  double netback_usd;
  double revenue_usd;
  double voyage_cost_usd; ///< Hors carbone.
  double carbon_cost_usd;
  double delivered_energy_mmbtu;
  double voyage_days;
};

struct TradeInputs {
  netback::CargoRequest cargo;
  market::MarketInputs market;
  config::DecisionRule rule;
  market::FuelType fuel;
};

struct TradePack {
  TradeInputs inputs;
  LegSummary leg_a;
  LegSummary leg_b;
  decision::DecisionResult decision; ///< Contient les jambes de couverture.
};

/**
 * @brief Évalue une cargaison pour un jeu de prix.
 * @throws core::InvalidConfigError si la règle est hors domaine.
 * @throws core::NotFoundError si une route ou le navire est absent.
 */
TradePack run_trade_decision(const market::ReferenceData& ref,
                             const netback::CargoRequest& cargo,
                             const market::MarketInputs& mkt,
                             const config::DecisionRule& rule,
                             market::FuelType fuel = market::FuelType::VLSFO);

/// @brief Une évaluation par observation, dans l'ordre fourni.
std::vector<backtest::DailyDecision>
evaluate_history(const market::ReferenceData& ref,
                 const netback::CargoRequest& cargo,
                 const std::vector<market::MarketObservation>& observations,
                 const config::DecisionRule& rule,
                 market::FuelType fuel = market::FuelType::VLSFO);

} // namespace pipeline
} // namespace dvb
