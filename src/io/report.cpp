#include "dvb/io/report.hpp"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>

#include <cmath>
#include <fstream>
#include <iomanip>
#include <string>

namespace {

inline double round_to(double x, int decimals) {
  const double f = std::pow(10.0, decimals);
  return std::round(x * f) / f;
}
inline double r2(double x) { return round_to(x, 2); }

inline QString qs(const std::string& s) { return QString::fromStdString(s); }

QJsonObject leg_to_json(const dvb::pipeline::LegSummary& leg) {
  return QJsonObject{
    {"destination",            qs(leg.destination)},
    {"port",                   qs(leg.port)},
    {"netback_usd",            r2(leg.netback_usd)},
    {"revenue_usd",            r2(leg.revenue_usd)},
    {"voyage_cost_usd",        r2(leg.voyage_cost_usd)},
    {"carbon_cost_usd",        r2(leg.carbon_cost_usd)},
    {"delivered_energy_mmbtu", r2(leg.delivered_energy_mmbtu)},
    {"voyage_days",            round_to(leg.voyage_days, 3)}
  };
}

QJsonArray legs_to_json(const std::vector<dvb::decision::HedgeLeg>& legs) {
  QJsonArray arr;
  for (const auto& l : legs) {
    arr.append(QJsonObject{
      {"leg",        QString::fromLatin1(dvb::decision::to_string(l.side)) + " " + qs(l.instrument)},
      {"side",       dvb::decision::to_string(l.side)},
      {"instrument", qs(l.instrument)},
      {"lots",       static_cast<qint64>(l.lots)}
    });
  }
  return arr;
}

// cellule CSV : entre guillemets si elle contient ',', '"' ou une fin de ligne ('"' doublé)
std::string csv_cell(const std::string& v) {
  if (v.find_first_of(",\"\r\n") == std::string::npos) return v;
  std::string q = "\"";
  for (char c : v) {
    if (c == '"') q += '"';
    q += c;
  }
  q += '"';
  return q;
}

// ouvre un flux CSV en précision fixe
bool open_csv(std::ofstream& ofs, const std::string& path, std::string* errMsg) {
  ofs.open(path);
  if (!ofs) {
    if (errMsg) *errMsg = "Cannot open CSV file: " + path;
    return false;
  }
  ofs.setf(std::ios::fixed);
  ofs << std::setprecision(2);
  return true;
}

bool close_csv(std::ofstream& ofs, const std::string& path, std::string* errMsg) {
  ofs.close();
  if (!ofs) {
    if (errMsg) *errMsg = "Write failed: " + path;
    return false;
  }
  qInfo() << "[report] written" << QString::fromStdString(path);
  return true;
}

} // namespace

namespace dvb::io {

QJsonObject trade_pack_to_json(const pipeline::TradePack& pack) {
  const auto& in  = pack.inputs;
  const auto& dec = pack.decision;

  QJsonObject inputs{
    {"load_port",            qs(in.cargo.load_port)},
    {"port_a",               qs(in.cargo.port_a)},
    {"port_b",               qs(in.cargo.port_b)},
    {"vessel_class",         qs(in.cargo.vessel_class)},
    {"cargo_capacity_m3",    in.cargo.cargo_capacity_m3},
    {"fuel_type",            market::to_string(in.fuel)},
    {"price_a_usd_mmbtu",    in.market.price_a},
    {"price_b_usd_mmbtu",    in.market.price_b},
    {"freight_rate_usd_day", in.market.freight_rate_usd_day},
    {"fuel_price_usd_t",     in.market.fuel_price_usd_t},
    {"eua_price_usd_t",      in.market.eua_price_usd_t},
    {"basis_haircut_pct",    in.rule.basis_haircut_pct},
    {"ops_buffer_usd",       in.rule.ops_buffer_usd},
    {"decision_buffer_usd",  in.rule.decision_buffer_usd},
    {"coverage_pct",         in.rule.coverage_pct},
    {"lot_size_a_mmbtu",     in.rule.lot_size_a},
    {"lot_size_b_mmbtu",     in.rule.lot_size_b},
    {"benchmark_a",          qs(in.rule.benchmark_a)},
    {"benchmark_b",          qs(in.rule.benchmark_b)},
    {"hedge_basis",          config::to_string(in.rule.hedge_basis)},
    {"keep_hedge_policy",    config::to_string(in.rule.keep_policy)}
  };

  QJsonObject dec_json{
    {"delta_raw_usd",      r2(dec.delta_netback_raw_usd)},
    {"delta_adj_usd",      r2(dec.delta_netback_adj_usd)},
    {"decision",           decision::to_string(dec.decision)},
    {"hedge_energy_mmbtu", r2(dec.hedge_energy_mmbtu)},
    {"lots_a",             static_cast<qint64>(dec.lots_a)},
    {"lots_b",             static_cast<qint64>(dec.lots_b)}
  };

  QJsonObject root;
  root["inputs"]     = inputs;
  root["leg_a"]      = leg_to_json(pack.leg_a);
  root["leg_b"]      = leg_to_json(pack.leg_b);
  root["decision"]   = dec_json;
  root["hedge_legs"] = legs_to_json(dec.hedge_legs);
  return root;
}

QJsonObject risk_pack_to_json(const risk::RiskPack& pack, const QString& evaluation_date) {
  QJsonArray flips;
  for (const auto& name : pack.scenarios_causing_flip) flips.append(qs(name));

  QJsonArray rows;
  for (const auto& sr : pack.stress_results) {
    rows.append(QJsonObject{
      {"scenario_name",                  qs(sr.scenario.name)},
      {"spread_shock_usd",               sr.scenario.spread_shock_usd},
      {"freight_shock_usd_day",          sr.scenario.freight_shock_usd_day},
      {"eua_shock_usd",                  sr.scenario.eua_shock_usd},
      {"pnl_impact_usd",                 r2(sr.pnl_impact_usd)},
      {"stressed_delta_netback_adj_usd", r2(sr.stressed_delta_netback_adj)},
      {"decision_flipped",               sr.decision_change},
      {"stressed_decision",              decision::to_string(sr.stressed_decision)}
    });
  }

  QJsonObject root;
  root["evaluation_date"]                 = evaluation_date;
  root["base_decision"]                   = decision::to_string(pack.base_result.decision);
  root["base_delta_netback_adj_usd"]      = r2(pack.base_result.delta_netback_adj_usd);
  root["worst_case_pnl_impact_usd"]       = r2(pack.worst_case_pnl_impact);
  root["scenarios_causing_decision_flip"] = flips;
  root["stress_scenarios"]                = rows;
  return root;
}

QJsonObject backtest_to_json(const backtest::BacktestResult& res) {
  const auto& m = res.metrics;

  QJsonObject summary{
    {"total_observations", static_cast<qint64>(m.total_observations)},
    {"triggered_trades",   static_cast<qint64>(m.triggered_trades)},
    {"hit_rate_pct",       r2(m.hit_rate * 100.0)},
    {"average_uplift_usd", r2(m.average_uplift_usd)},
    {"total_uplift_usd",   r2(m.total_uplift_usd)},
    {"max_drawdown_usd",   r2(m.max_drawdown_usd)},
    // null = données insuffisantes, jamais 0
    {"sharpe_ratio",       m.sharpe_ratio ? QJsonValue(round_to(*m.sharpe_ratio, 3)) : QJsonValue()}
  };

  QJsonArray curve;
  for (const auto& p : res.equity_curve) {
    curve.append(QJsonObject{{"date", qs(p.date)}, {"cumulative_pnl", r2(p.cumulative_pnl)}});
  }

  QJsonObject root;
  root["backtest_summary"] = summary;
  root["equity_curve"]     = curve;
  return root;
}

bool write_json(const QString& path, const QJsonObject& obj, QString* errMsg) {
  QFile f(path);
  if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
    if (errMsg) *errMsg = f.errorString();
    qWarning() << "[report] cannot open" << path << ":" << f.errorString();
    return false;
  }
  const QByteArray bytes = QJsonDocument(obj).toJson(QJsonDocument::Indented);
  if (f.write(bytes) != bytes.size()) {
    if (errMsg) *errMsg = f.errorString();
    return false;
  }
  f.close();
  qInfo() << "[report] written" << path;
  return true;
}

bool write_trade_ticket_csv(const std::string& path, const pipeline::TradePack& pack,
                            std::string* errMsg) {
  std::ofstream ofs;
  if (!open_csv(ofs, path, errMsg)) return false;

  const auto& in  = pack.inputs;
  const auto& dec = pack.decision;
  ofs << "field,value\n";
  ofs << "load_port," << csv_cell(in.cargo.load_port) << '\n'
      << "port_a," << csv_cell(in.cargo.port_a) << '\n'
      << "port_b," << csv_cell(in.cargo.port_b) << '\n'
      << "vessel_class," << csv_cell(in.cargo.vessel_class) << '\n'
      << "price_a_usd_mmbtu," << in.market.price_a << '\n'
      << "price_b_usd_mmbtu," << in.market.price_b << '\n'
      << "netback_a_usd," << pack.leg_a.netback_usd << '\n'
      << "netback_b_usd," << pack.leg_b.netback_usd << '\n'
      << "delta_raw_usd," << dec.delta_netback_raw_usd << '\n'
      << "delta_adj_usd," << dec.delta_netback_adj_usd << '\n'
      << "decision_buffer_usd," << dec.decision_buffer_usd << '\n'
      << "decision," << decision::to_string(dec.decision) << '\n'
      << "hedge_energy_mmbtu," << dec.hedge_energy_mmbtu << '\n'
      << csv_cell("lots_" + in.rule.benchmark_a) << ',' << dec.lots_a << '\n'
      << csv_cell("lots_" + in.rule.benchmark_b) << ',' << dec.lots_b << '\n';
  for (std::size_t i = 0; i < dec.hedge_legs.size(); ++i) {
    const auto& l = dec.hedge_legs[i];
    ofs << "hedge_leg_" << (i + 1) << ','
        << csv_cell(std::string(decision::to_string(l.side)) + ' ' + l.instrument + ' '
                    + std::to_string(l.lots) + " lots")
        << '\n';
  }
  return close_csv(ofs, path, errMsg);
}

bool write_stress_csv(const std::string& path, const risk::RiskPack& pack, std::string* errMsg) {
  std::ofstream ofs;
  if (!open_csv(ofs, path, errMsg)) return false;

  ofs << "scenario,spread_shock_usd,freight_shock_usd_day,eua_shock_usd,"
         "base_decision,stressed_decision,decision_flipped,pnl_impact_usd,"
         "base_delta_adj_usd,stressed_delta_adj_usd\n";
  for (const auto& sr : pack.stress_results) {
    ofs << csv_cell(sr.scenario.name) << ','
        << sr.scenario.spread_shock_usd << ','
        << sr.scenario.freight_shock_usd_day << ','
        << sr.scenario.eua_shock_usd << ','
        << decision::to_string(sr.base_decision) << ','
        << decision::to_string(sr.stressed_decision) << ','
        << (sr.decision_change ? "true" : "false") << ','
        << sr.pnl_impact_usd << ','
        << sr.base_delta_netback_adj << ','
        << sr.stressed_delta_netback_adj << '\n';
  }
  return close_csv(ofs, path, errMsg);
}

bool write_equity_curve_csv(const std::string& path, const backtest::BacktestResult& res,
                            std::string* errMsg) {
  std::ofstream ofs;
  if (!open_csv(ofs, path, errMsg)) return false;

  ofs << "date,cumulative_pnl\n";
  for (const auto& p : res.equity_curve) {
    ofs << csv_cell(p.date) << ',' << p.cumulative_pnl << '\n';
  }
  return close_csv(ofs, path, errMsg);
}

bool write_decision_history_csv(const std::string& path, const backtest::BacktestResult& res,
                                std::string* errMsg) {
  std::ofstream ofs;
  if (!open_csv(ofs, path, errMsg)) return false;

  ofs << "date,decision,delta_netback_raw_usd,delta_netback_adj_usd,"
         "netback_a_usd,netback_b_usd,triggered,pnl,cumulative_pnl\n";
  // history et equity_curve sont alignées ligne à ligne
  for (std::size_t i = 0; i < res.history.size(); ++i) {
    const auto& h = res.history[i];
    const auto& e = res.equity_curve[i];
    ofs << csv_cell(h.date) << ','
        << decision::to_string(h.decision) << ','
        << h.delta_netback_raw_usd << ','
        << h.delta_netback_adj_usd << ','
        << h.netback_a_usd << ','
        << h.netback_b_usd << ','
        << (h.decision == decision::Decision::Divert ? 1 : 0) << ','
        << e.pnl << ','
        << e.cumulative_pnl << '\n';
  }
  return close_csv(ofs, path, errMsg);
}

QString report_path(const QString& dir, const QString& prefix, const QString& ext,
                    const QDateTime& when) {
  QDir().mkpath(dir); // au cas où
  return QDir(dir).filePath(prefix + "_" + when.toString("yyyyMMdd_HHmmss") + "." + ext);
}

} // namespace dvb::io
