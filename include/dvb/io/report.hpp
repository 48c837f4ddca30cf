#pragma once
#include <string>

#include <QDateTime>
#include <QJsonObject>
#include <QString>

#include <dvb/backtest/backtest.hpp>
#include <dvb/pipeline/trade_pack.hpp>
#include <dvb/risk/stress.hpp>

namespace dvb::io {

// Rapports JSON (QJsonObject) et CSV. Montants arrondis à 2 décimales, Sharpe à 3 ;
// un Sharpe absent est écrit null. Aucun formatage monétaire ni locale.

// inputs / leg_a / leg_b / decision / hedge_legs (leg_x.destination porte le libellé)
QJsonObject trade_pack_to_json(const pipeline::TradePack& pack);

// base_decision, worst_case_pnl_impact_usd, scenarios_causing_decision_flip, stress_scenarios[]
QJsonObject risk_pack_to_json(const risk::RiskPack& pack, const QString& evaluation_date);

// backtest_summary{...} + equity_curve[{date, cumulative_pnl}]
QJsonObject backtest_to_json(const backtest::BacktestResult& res);

// Écrit un document indenté. errMsg renseigné en cas d'échec.
[[nodiscard]] bool write_json(const QString& path, const QJsonObject& obj, QString* errMsg = nullptr);

// Trade ticket "field,value" (vue à plat pour le desk).
[[nodiscard]] bool write_trade_ticket_csv(const std::string& path, const pipeline::TradePack& pack,
                                          std::string* errMsg = nullptr);

// scenario,spread_shock_usd,...,stressed_delta_adj_usd
[[nodiscard]] bool write_stress_csv(const std::string& path, const risk::RiskPack& pack,
                                    std::string* errMsg = nullptr);

// date,cumulative_pnl
[[nodiscard]] bool write_equity_curve_csv(const std::string& path, const backtest::BacktestResult& res,
                                          std::string* errMsg = nullptr);

// date,decision,delta_netback_raw_usd,...,pnl,cumulative_pnl
[[nodiscard]] bool write_decision_history_csv(const std::string& path, const backtest::BacktestResult& res,
                                              std::string* errMsg = nullptr);

// "<dir>/<prefix>_yyyyMMdd_HHmmss.<ext>" ; crée le répertoire si besoin.
QString report_path(const QString& dir, const QString& prefix, const QString& ext,
                    const QDateTime& when = QDateTime::currentDateTimeUtc());

} // namespace dvb::io
