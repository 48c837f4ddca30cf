#include "dvb/backtest/backtest.hpp"
#include "dvb/core/errors.hpp"
#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

using namespace dvb;
using decision::Decision;

static backtest::DailyDecision row(const char* date, Decision d, double adj) {
  return {date, d, adj + 10.0, adj, 1.0e8, 1.0e8 + adj};
}

int main() {
  constexpr double EPS = 1e-9;

  // 1) Série calculée à la main, fournie dans le désordre
  std::vector<backtest::DailyDecision> rows{
    row("2024-01-04", Decision::Divert,  30.0),
    row("2024-01-01", Decision::Divert, 100.0),
    row("2024-01-06", Decision::Divert,  50.0),
    row("2024-01-03", Decision::Divert, -60.0),
    row("2024-01-02", Decision::Keep,   -50.0),
    row("2024-01-05", Decision::Keep,   999.0),
  };
  const auto res = backtest::run_backtest(rows);
  const auto& m = res.metrics;

  assert(m.total_observations == 6);
  assert(m.triggered_trades == 4);
  assert(std::abs(m.hit_rate - 4.0 / 6.0) < EPS);
  assert(std::abs(m.total_uplift_usd - 120.0) < EPS);
  assert(std::abs(m.average_uplift_usd - 30.0) < EPS);

  // ordre chronologique, KEEP à P&L nul
  const double cum_expected[] = {100.0, 100.0, 40.0, 70.0, 70.0, 120.0};
  assert(res.equity_curve.size() == 6);
  for (std::size_t i = 0; i < 6; ++i) {
    assert(std::abs(res.equity_curve[i].cumulative_pnl - cum_expected[i]) < EPS);
    assert(res.equity_curve[i].date == res.history[i].date);
  }
  assert(res.equity_curve.front().date == "2024-01-01");
  assert(res.equity_curve[1].pnl == 0.0);
  assert(res.equity_curve[4].pnl == 0.0);

  // drawdown 100 -> 40
  assert(std::abs(m.max_drawdown_usd - 60.0) < EPS);

  // Sharpe : moyenne 20, variance d'échantillon 14600/5
  assert(m.sharpe_ratio.has_value());
  const double expected_sharpe = 20.0 / std::sqrt(14600.0 / 5.0) * std::sqrt(252.0);
  assert(std::abs(*m.sharpe_ratio - expected_sharpe) < 1e-9);

  // 2) Drawdown : pic initialisé au premier point, pas à 0
  assert(std::abs(backtest::max_drawdown({-10.0, -20.0}) - 10.0) < EPS);
  assert(backtest::max_drawdown({1.0, 2.0, 3.0}) == 0.0);
  assert(backtest::max_drawdown({}) == 0.0);

  // 3) Sharpe absent : moins de 5 lignes, ou dispersion nulle
  assert(!backtest::sharpe_ratio({1.0, 2.0, 3.0, 4.0}).has_value());
  assert(!backtest::sharpe_ratio({0.0, 0.0, 0.0, 0.0, 0.0, 0.0}).has_value());
  std::vector<backtest::DailyDecision> all_keep;
  for (int d = 1; d <= 7; ++d) {
    all_keep.push_back(row(("2024-02-0" + std::to_string(d)).c_str(), Decision::Keep, -1.0));
  }
  const auto flat = backtest::run_backtest(all_keep);
  assert(!flat.metrics.sharpe_ratio.has_value());
  assert(flat.metrics.triggered_trades == 0);
  assert(flat.metrics.average_uplift_usd == 0.0);
  assert(flat.metrics.max_drawdown_usd == 0.0);

  // 4) Entrée vide
  bool thrown = false;
  try { (void)backtest::run_backtest({}); }
  catch (const core::EmptyInputError&) { thrown = true; }
  assert(thrown);

  std::cout << "Backtest OK. Sharpe=" << *m.sharpe_ratio << "\n";
  return 0;
}
