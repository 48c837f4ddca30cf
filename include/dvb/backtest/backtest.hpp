#pragma once
/**
 * @file backtest.hpp
 * @brief Validation historique de la règle : hit rate, uplift, courbe d'équité, drawdown, Sharpe.
 *
 * # Conventions
 * - triggered  : decision == DIVERT.
 * - pnl_t      : delta_adj_t si déclenché, 0 sinon ("pas de trade, pas de P&L").
 * - cumulative : somme cumulée de pnl_t (départ à 0).
 * - max_drawdown = max_t( max_{s<=t} cumulative_s - cumulative_t ) >= 0.
 * - Sharpe = mean(pnl) / std(pnl) * sqrt(252), std d'échantillon sur toutes les lignes ;
 *   défini seulement si n >= 5 et std > 0, sinon absent (données insuffisantes).
 *
 * # Ordre
 * - Les lignes sont remises dans l'ordre chronologique (tri stable sur la date ISO)
 *   avant la passe cumulative, seule étape sensible à l'ordre.
 *
 * # Remarque
 * - Mesure la fréquence de déclenchement et l'uplift conditionnel, pas un P&L de trading
 *   (ni slippage, ni coûts de couverture).
 */

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <dvb/decision/decision_engine.hpp>

namespace dvb {
namespace backtest {

inline constexpr std::size_t kMinObservationsForSharpe = 5;
inline constexpr double kTradingDaysPerYear = 252.0;

/// @brief Décision d'une date, produite en amont par le pipeline.
struct DailyDecision {
  std::string date; ///< "YYYY-MM-DD"
  decision::Decision decision;
  double delta_netback_raw_usd;
  double delta_netback_adj_usd;
  double netback_a_usd;
  double netback_b_usd;
};

struct EquityPoint {
  std::string date;
  double pnl;
  double cumulative_pnl;
};

struct BacktestMetrics {
  std::size_t total_observations;
  std::size_t triggered_trades;
  double hit_rate;
  double average_uplift_usd; ///< Moyenne de delta_adj sur les lignes déclenchées (0 si aucune).
  double total_uplift_usd;   ///< Somme de delta_adj sur les lignes déclenchées.
  double max_drawdown_usd;
  std::optional<double> sharpe_ratio;
};

struct BacktestResult {
  BacktestMetrics metrics;
  std::vector<EquityPoint> equity_curve;    ///< Une entrée par ligne, ordre chronologique.
  std::vector<DailyDecision> history;       ///< Historique trié.
};

/// @throws core::EmptyInputError si rows est vide.
BacktestResult run_backtest(std::vector<DailyDecision> rows);

/// @brief Plus forte baisse pic -> creux d'une série cumulée (0 si vide ou monotone croissante).
double max_drawdown(const std::vector<double>& cumulative) noexcept;

/// @brief Sharpe annualisé ; absent si n < 5 ou écart-type nul / indéfini.
std::optional<double> sharpe_ratio(const std::vector<double>& daily_pnl) noexcept;

} // namespace backtest
} // namespace dvb
