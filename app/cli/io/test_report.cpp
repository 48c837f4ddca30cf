#include "dvb/io/report.hpp"
#include "dvb/risk/stress.hpp"
#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QTemporaryDir>
#include <cassert>
#include <cmath>
#include <fstream>
#include <initializer_list>
#include <iostream>
#include <string>
#include <vector>

using namespace dvb;

static market::ReferenceData make_ref() {
  market::ReferenceData ref;
  ref.routes.add(market::Route("US_Gulf", "Rotterdam", 5000.0));
  ref.routes.add(market::Route("US_Gulf", "Tokyo", 9500.0));
  ref.vessels.add(market::Vessel("TFDE", 174000.0, 19.5, 19.5, 0.10, 130.0, 130.0));
  ref.carbon.values[market::CarbonParams::kCo2Vlsfo] = 3.114;
  return ref;
}

static std::size_t count_lines(const std::string& path) {
  std::ifstream f(path);
  std::size_t n = 0;
  std::string line;
  while (std::getline(f, line)) ++n;
  return n;
}

int main() {
  const auto ref = make_ref();
  const netback::CargoRequest cargo{"US_Gulf", "Rotterdam", "Tokyo", "TFDE", 174000.0};
  const market::MarketInputs mkt{35.69, 38.44, 85000.0, 583.0, 74.40};
  config::DecisionRule rule;
  const auto pack = pipeline::run_trade_decision(ref, cargo, mkt, rule);

  // 1) Trade pack JSON
  const QJsonObject tp = io::trade_pack_to_json(pack);
  for (const char* k : {"inputs", "leg_a", "leg_b", "decision", "hedge_legs"}) assert(tp.contains(k));
  assert(tp["decision"].toObject()["decision"].toString() == "DIVERT");
  assert(tp["leg_b"].toObject()["destination"].toString() == "Asia");
  assert(tp["inputs"].toObject()["vessel_class"].toString() == "TFDE");
  const QJsonArray legs = tp["hedge_legs"].toArray();
  assert(legs.size() == 2);
  assert(legs[0].toObject()["leg"].toString() == "BUY JKM");
  assert(legs[0].toObject()["lots"].toInteger() == pack.decision.lots_b);

  // arrondi à 2 décimales
  const double nb = tp["leg_a"].toObject()["netback_usd"].toDouble();
  assert(std::abs(nb - pack.leg_a.netback_usd) <= 0.005 + 1e-6);

  // 2) Risk report JSON
  const auto rp = risk::run_stress_test(pack.decision, ref, cargo, mkt, rule, config::StressConfig{});
  const QJsonObject rj = io::risk_pack_to_json(rp, "2024-06-03");
  assert(rj["evaluation_date"].toString() == "2024-06-03");
  assert(rj["stress_scenarios"].toArray().size() == 6);
  assert(rj["stress_scenarios"].toArray()[0].toObject()["scenario_name"].toString() == "Spread Collapse");
  assert(rj["scenarios_causing_decision_flip"].isArray());

  // 3) Backtest JSON : Sharpe null si données insuffisantes
  std::vector<backtest::DailyDecision> rows{
    {"2024-01-02", decision::Decision::Divert, 1000.0, 900.0, 1.0, 2.0},
    {"2024-01-03", decision::Decision::Keep, 10.0, -5.0, 1.0, 2.0},
  };
  const auto bt = backtest::run_backtest(rows);
  const QJsonObject bj = io::backtest_to_json(bt);
  const QJsonObject summary = bj["backtest_summary"].toObject();
  assert(summary["sharpe_ratio"].isNull());
  assert(summary["hit_rate_pct"].toDouble() == 50.0);
  assert(summary["total_observations"].toInt() == 2);
  assert(bj["equity_curve"].toArray().size() == 2);

  // 4) Écriture des fichiers
  QTemporaryDir tmp;
  assert(tmp.isValid());
  const QString out = QDir(tmp.path()).filePath("reports");
  const QDateTime when(QDate(2024, 6, 3), QTime(14, 5, 9), Qt::UTC);
  const QString json_path = io::report_path(out, "trade_pack", "json", when);
  assert(json_path.endsWith("trade_pack_20240603_140509.json"));
  assert(QDir(out).exists());

  QString err;
  const bool ok = io::write_json(json_path, tp, &err);
  assert(ok);
  QFile f(json_path);
  const bool opened = f.open(QIODevice::ReadOnly);
  assert(opened);
  const QJsonDocument back = QJsonDocument::fromJson(f.readAll());
  assert(back.isObject() && back.object()["decision"].toObject()["decision"].toString() == "DIVERT");

  const bool bad = io::write_json(QDir(out).filePath("missing/dir/x.json"), tp, &err);
  assert(!bad && !err.isEmpty());

  std::string serr;
  const std::string stress_csv = QDir(out).filePath("stress.csv").toStdString();
  const std::string equity_csv = QDir(out).filePath("equity.csv").toStdString();
  const std::string trades_csv = QDir(out).filePath("trades.csv").toStdString();
  const std::string ticket_csv = QDir(out).filePath("ticket.csv").toStdString();
  const bool w1 = io::write_stress_csv(stress_csv, rp, &serr);
  const bool w2 = io::write_equity_curve_csv(equity_csv, bt, &serr);
  const bool w3 = io::write_decision_history_csv(trades_csv, bt, &serr);
  const bool w4 = io::write_trade_ticket_csv(ticket_csv, pack, &serr);
  assert(w1 && w2 && w3 && w4);
  assert(count_lines(stress_csv) == 7); // en-tête + 6 scénarios
  assert(count_lines(equity_csv) == 3);
  assert(count_lines(trades_csv) == 3);
  assert(count_lines(ticket_csv) > 10);

  // 5) Cellules texte contenant ',' ou '"' : entre guillemets, '"' doublé
  auto rp_named = rp;
  rp_named.stress_results[0].scenario.name = "Spread, \"hard\" Collapse";
  const std::string named_csv = QDir(out).filePath("stress_named.csv").toStdString();
  const bool w5 = io::write_stress_csv(named_csv, rp_named, &serr);
  assert(w5);
  assert(count_lines(named_csv) == 7);
  {
    std::ifstream in(named_csv);
    std::string header, first;
    std::getline(in, header);
    std::getline(in, first);
    const std::string quoted = "\"Spread, \"\"hard\"\" Collapse\",";
    assert(first.compare(0, quoted.size(), quoted) == 0);
    // hors guillemets, autant de séparateurs que l'en-tête
    std::size_t seps = 0;
    bool in_quotes = false;
    for (char c : first) {
      if (c == '"') in_quotes = !in_quotes;
      else if (c == ',' && !in_quotes) ++seps;
    }
    std::size_t header_seps = 0;
    for (char c : header) if (c == ',') ++header_seps;
    assert(seps == header_seps);
    // nom sans séparateur : écrit tel quel
    std::string second;
    std::getline(in, second);
    const std::string plain = rp.stress_results[1].scenario.name + ",";
    assert(second.compare(0, plain.size(), plain) == 0);
  }

  std::cout << "Reports OK.\n";
  return 0;
}
