#include <dvb/backtest/backtest.hpp>
#include <dvb/core/errors.hpp>
#include <dvb/core/stats.hpp>

#include <algorithm>
#include <cmath>

namespace dvb {
namespace backtest {

double max_drawdown(const std::vector<double>& cumulative) noexcept {
  if (cumulative.empty()) return 0.0;

  // pic courant initialisé sur le premier point de la courbe
  double peak   = cumulative.front();
  double max_dd = 0.0;
  for (double c : cumulative) {
    peak   = std::max(peak, c);
    max_dd = std::max(max_dd, peak - c);
  }
  return max_dd;
}

std::optional<double> sharpe_ratio(const std::vector<double>& daily_pnl) noexcept {
  if (daily_pnl.size() < kMinObservationsForSharpe) return std::nullopt;

  core::RunningStats st;
  for (double x : daily_pnl) st.add(x);

  const double sd = st.std_dev();
  if (!std::isfinite(sd) || sd <= 0.0) return std::nullopt; // variance nulle : ratio indéfini
  return st.mean() / sd * std::sqrt(kTradingDaysPerYear);
}

BacktestResult run_backtest(std::vector<DailyDecision> rows) {
  if (rows.empty()) {
    throw core::EmptyInputError("run_backtest: no observations to backtest");
  }

  std::stable_sort(rows.begin(), rows.end(),
                   [](const DailyDecision& x, const DailyDecision& y) { return x.date < y.date; });

  BacktestResult res;
  res.equity_curve.reserve(rows.size());

  std::vector<double> pnl;
  std::vector<double> cumulative;
  pnl.reserve(rows.size());
  cumulative.reserve(rows.size());

  std::size_t triggered = 0;
  double total_uplift = 0.0;
  double cum = 0.0;

  for (const auto& r : rows) {
    const bool hit = (r.decision == decision::Decision::Divert);
    const double p = hit ? r.delta_netback_adj_usd : 0.0;
    if (hit) {
      ++triggered;
      total_uplift += r.delta_netback_adj_usd;
    }
    cum += p;
    pnl.push_back(p);
    cumulative.push_back(cum);
    res.equity_curve.push_back({r.date, p, cum});
  }

  BacktestMetrics& m   = res.metrics;
  m.total_observations = rows.size();
  m.triggered_trades   = triggered;
  m.hit_rate           = static_cast<double>(triggered) / static_cast<double>(rows.size());
  m.total_uplift_usd   = total_uplift;
  m.average_uplift_usd = triggered ? total_uplift / static_cast<double>(triggered) : 0.0;
  m.max_drawdown_usd   = max_drawdown(cumulative);
  m.sharpe_ratio       = sharpe_ratio(pnl);

  res.history = std::move(rows);
  return res;
}

} // namespace backtest
} // namespace dvb
