#include <dvb/backtest/backtest.hpp>
#include <dvb/config/decision_config.hpp>
#include <dvb/core/errors.hpp>
#include <dvb/io/reference_csv.hpp>
#include <dvb/io/report.hpp>
#include <dvb/market/market_data.hpp>
#include <dvb/pipeline/trade_pack.hpp>
#include <dvb/risk/stress.hpp>

#include <QDateTime>
#include <QDebug>
#include <QString>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

// Codes de sortie
static constexpr int kExitUsage  = 1;
static constexpr int kExitIo     = 2;
static constexpr int kExitDomain = 3;

static void print_usage(const char* prog) {
  std::cerr << "Usage:\n  " << prog
            << " [--data-dir DIR] [--load-port P] [--europe-port P] [--asia-port P]"
            << " [--vessel-class C] [--cargo-m3 V] [--fuel vlsfo|lng]"
            << " [--basis F] [--ops-buffer USD] [--decision-buffer USD] [--coverage F]"
            << " [--hedge-basis max|stronger] [--keep-hedge none|reverse]"
            << " [--stress] [--backtest HISTORY_CSV] [--save] [--out-dir DIR]\n";
}

static std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

static void log_warnings(const std::vector<std::string>& warnings) {
  for (const auto& w : warnings) qWarning().noquote() << "[data]" << QString::fromStdString(w);
}

static void rule_line(const char c = '=') { std::cout << std::string(60, c) << "\n"; }

static void print_trade_note(const dvb::pipeline::TradePack& pack,
                             const dvb::market::MarketSnapshot& snap) {
  const auto& in  = pack.inputs;
  const auto& dec = pack.decision;
  const auto& prov = snap.provenance;
  auto p = [&](const char* k) { auto it = prov.find(k); return it == prov.end() ? std::string("?") : it->second; };

  std::cout << std::fixed;
  rule_line();
  std::cout << "LNG DIVERSION TRADE NOTE\n";
  rule_line();
  std::cout << "Route : " << in.cargo.load_port << " -> " << in.cargo.port_a
            << " (" << in.rule.benchmark_a << ") vs " << in.cargo.port_b
            << " (" << in.rule.benchmark_b << ")\n"
            << "Vessel: " << in.cargo.vessel_class << " | Cargo: "
            << std::setprecision(0) << in.cargo.cargo_capacity_m3 << " m3"
            << " | Fuel: " << dvb::market::to_string(in.fuel) << "\n"
            << "As of : " << snap.asof << "\n";
  rule_line('-');
  std::cout << std::setprecision(2)
            << in.rule.benchmark_a << "     : " << in.market.price_a << " USD/MMBtu (" << p("TTF") << ")\n"
            << in.rule.benchmark_b << "     : " << in.market.price_b << " USD/MMBtu (" << p("JKM") << ")\n"
            << std::setprecision(0)
            << "Freight : " << in.market.freight_rate_usd_day << " USD/day (" << p("FREIGHT") << ")\n"
            << "Fuel    : " << in.market.fuel_price_usd_t << " USD/t (" << p("FUEL") << ")\n"
            << std::setprecision(2)
            << "EUA     : " << in.market.eua_price_usd_t << " USD/tCO2 (" << p("EUA") << ")\n";
  rule_line('-');
  std::cout << std::setprecision(0)
            << pack.leg_a.destination << " netback : " << pack.leg_a.netback_usd << " USD\n"
            << pack.leg_b.destination << " netback : " << pack.leg_b.netback_usd << " USD\n"
            << "Raw uplift      : " << dec.delta_netback_raw_usd << " USD\n"
            << "Adjusted uplift : " << dec.delta_netback_adj_usd << " USD\n"
            << std::setprecision(3)
            << "  (basis=" << dec.basis_haircut_pct
            << std::setprecision(0)
            << ", ops=" << dec.ops_buffer_usd
            << ", threshold=" << dec.decision_buffer_usd << ")\n";
  rule_line('-');
  std::cout << "Decision: " << dvb::decision::to_string(dec.decision) << "\n";
  if (dec.hedge_legs.empty()) {
    std::cout << "Hedge   : none (" << std::setprecision(0) << dec.hedge_energy_mmbtu << " MMBtu unhedged)\n";
  } else {
    std::cout << "Hedge   :";
    for (const auto& l : dec.hedge_legs) {
      std::cout << " " << dvb::decision::to_string(l.side) << " " << l.instrument
                << " " << l.lots << " lots |";
    }
    std::cout << "\n";
  }
  rule_line();
}

static void print_risk_pack(const dvb::risk::RiskPack& rp) {
  std::cout << std::fixed << std::setprecision(0);
  rule_line();
  std::cout << "STRESS PACK (base: " << dvb::decision::to_string(rp.base_result.decision) << ")\n";
  rule_line('-');
  for (const auto& sr : rp.stress_results) {
    std::cout << std::left << std::setw(18) << sr.scenario.name << std::right
              << " pnl_impact=" << std::setw(12) << sr.pnl_impact_usd
              << "  -> " << dvb::decision::to_string(sr.stressed_decision)
              << (sr.decision_change ? "  (FLIP)" : "") << "\n";
  }
  rule_line('-');
  std::cout << "Worst case impact : " << rp.worst_case_pnl_impact << " USD\n";
  std::cout << "Decision flips    : " << rp.scenarios_causing_flip.size() << "\n";
  rule_line();
}

static void print_backtest(const dvb::backtest::BacktestResult& res) {
  const auto& m = res.metrics;
  std::cout << std::fixed;
  rule_line();
  std::cout << "RULE VALIDATION (Backtest)\n"
            << "Note: trigger frequency and conditional uplift, not trading P&L\n";
  rule_line('-');
  std::cout << "Observations      : " << m.total_observations << "\n"
            << "Triggered trades  : " << m.triggered_trades << "\n"
            << std::setprecision(1)
            << "Hit rate          : " << m.hit_rate * 100.0 << " %\n"
            << std::setprecision(0)
            << "Average uplift    : " << m.average_uplift_usd << " USD\n"
            << "Total uplift      : " << m.total_uplift_usd << " USD\n"
            << "Max drawdown      : " << m.max_drawdown_usd << " USD\n";
  if (m.sharpe_ratio) std::cout << std::setprecision(3) << "Sharpe (ann.)     : " << *m.sharpe_ratio << "\n";
  else                std::cout << "Sharpe (ann.)     : n/a (insufficient data)\n";
  rule_line();
}

int main(int argc, char** argv) {
  std::string data_dir = "data";
  std::string out_dir  = "reports";
  std::string history_csv;
  bool want_stress = false;
  bool want_save   = false;

  dvb::netback::CargoRequest cargo{"US_Gulf", "Rotterdam", "Tokyo", "TFDE", 174000.0};
  dvb::market::FuelType fuel = dvb::market::FuelType::VLSFO;

  std::optional<double> basis, ops_buffer, decision_buffer, coverage;
  dvb::config::HedgeEnergyBasis hedge_basis = dvb::config::HedgeEnergyBasis::MaxOfBoth;
  dvb::config::KeepHedgePolicy keep_policy  = dvb::config::KeepHedgePolicy::None;

  try {
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      const bool has_val = i + 1 < argc;
      if (arg == "--data-dir" && has_val)             data_dir = argv[++i];
      else if (arg == "--load-port" && has_val)       cargo.load_port = argv[++i];
      else if (arg == "--europe-port" && has_val)     cargo.port_a = argv[++i];
      else if (arg == "--asia-port" && has_val)       cargo.port_b = argv[++i];
      else if (arg == "--vessel-class" && has_val)    cargo.vessel_class = argv[++i];
      else if (arg == "--cargo-m3" && has_val)        cargo.cargo_capacity_m3 = std::stod(argv[++i]);
      else if (arg == "--basis" && has_val)           basis = std::stod(argv[++i]);
      else if (arg == "--ops-buffer" && has_val)      ops_buffer = std::stod(argv[++i]);
      else if (arg == "--decision-buffer" && has_val) decision_buffer = std::stod(argv[++i]);
      else if (arg == "--coverage" && has_val)        coverage = std::stod(argv[++i]);
      else if (arg == "--fuel" && has_val) {
        const std::string f = lower(argv[++i]);
        if (f == "vlsfo") fuel = dvb::market::FuelType::VLSFO;
        else if (f == "lng") fuel = dvb::market::FuelType::LNG;
        else { std::cerr << "Unknown --fuel: " << f << "\n"; return kExitUsage; }
      } else if (arg == "--hedge-basis" && has_val) {
        const std::string b = lower(argv[++i]);
        if (b == "max") hedge_basis = dvb::config::HedgeEnergyBasis::MaxOfBoth;
        else if (b == "stronger") hedge_basis = dvb::config::HedgeEnergyBasis::StrongerDestination;
        else { std::cerr << "Unknown --hedge-basis: " << b << "\n"; return kExitUsage; }
      } else if (arg == "--keep-hedge" && has_val) {
        const std::string k = lower(argv[++i]);
        if (k == "none") keep_policy = dvb::config::KeepHedgePolicy::None;
        else if (k == "reverse") keep_policy = dvb::config::KeepHedgePolicy::Reverse;
        else { std::cerr << "Unknown --keep-hedge: " << k << "\n"; return kExitUsage; }
      }
      else if (arg == "--stress")                     want_stress = true;
      else if (arg == "--backtest" && has_val)        history_csv = argv[++i];
      else if (arg == "--save")                       want_save = true;
      else if (arg == "--out-dir" && has_val)         out_dir = argv[++i];
      else if (arg == "--help" || arg == "-h")        { print_usage(argv[0]); return 0; }
      else {
        std::cerr << "Unknown option: " << arg << "\n";
        print_usage(argv[0]);
        return kExitUsage;
      }
    }
  } catch (const std::exception&) {
    // stod sur une valeur non numérique
    print_usage(argv[0]);
    return kExitUsage;
  }

  // --- Données statiques ---
  std::vector<std::string> warnings;
  const auto ref = dvb::io::load_reference_data(data_dir, &warnings);
  const auto params = dvb::io::read_params_csv(data_dir + "/config.csv", nullptr, &warnings);
  log_warnings(warnings);
  if (ref.routes.size() == 0 || ref.vessels.size() == 0 || params.empty()) {
    std::cerr << "Reference data missing or unreadable in: " << data_dir << "\n";
    return kExitIo;
  }
  qInfo() << "[data]" << ref.routes.size() << "routes," << ref.vessels.size() << "vessel classes";

  try {
    dvb::config::validate_params(params);
    auto rule = dvb::config::decision_rule_from_params(params);
    const auto stress = dvb::config::stress_config_from_params(params);

    // surcharges CLI
    if (basis)           rule.basis_haircut_pct   = *basis;
    if (ops_buffer)      rule.ops_buffer_usd      = *ops_buffer;
    if (decision_buffer) rule.decision_buffer_usd = *decision_buffer;
    if (coverage)        rule.coverage_pct        = *coverage;
    rule.hedge_basis = hedge_basis;
    rule.keep_policy = keep_policy;
    qDebug() << "[CLI] rule basis=" << rule.basis_haircut_pct << " ops=" << rule.ops_buffer_usd
             << " buffer=" << rule.decision_buffer_usd << " coverage=" << rule.coverage_pct;

    // --- Mode backtest ---
    if (!history_csv.empty()) {
      std::size_t ignored = 0;
      std::vector<std::string> hist_warn;
      const auto obs = dvb::io::read_history_csv(history_csv, &ignored, &hist_warn);
      log_warnings(hist_warn);
      if (obs.empty()) {
        std::cerr << "No usable history rows in: " << history_csv << "\n";
        return kExitIo;
      }
      qInfo() << "[backtest]" << obs.size() << "observations," << ignored << "ignored";

      const auto rows = dvb::pipeline::evaluate_history(ref, cargo, obs, rule, fuel);
      const auto res = dvb::backtest::run_backtest(rows);
      print_backtest(res);

      if (want_save) {
        const QString dir = QString::fromStdString(out_dir);
        const QDateTime now = QDateTime::currentDateTimeUtc();
        QString err;
        std::string serr;
        const QString json_path   = dvb::io::report_path(dir, "backtest", "json", now);
        const QString equity_path = dvb::io::report_path(dir, "equity_curve", "csv", now);
        const QString trades_path = dvb::io::report_path(dir, "backtest_trades", "csv", now);
        if (!dvb::io::write_json(json_path, dvb::io::backtest_to_json(res), &err)) {
          std::cerr << "Save failed: " << err.toStdString() << "\n";
          return kExitIo;
        }
        if (!dvb::io::write_equity_curve_csv(equity_path.toStdString(), res, &serr) ||
            !dvb::io::write_decision_history_csv(trades_path.toStdString(), res, &serr)) {
          std::cerr << "Save failed: " << serr << "\n";
          return kExitIo;
        }
        std::cout << "Saved: " << json_path.toStdString() << "\n"
                  << "Saved: " << equity_path.toStdString() << "\n"
                  << "Saved: " << trades_path.toStdString() << "\n";
      }
      return 0;
    }

    // --- Décision courante ---
    const auto snap = dvb::market::make_proxy_snapshot(params);
    const auto pack = dvb::pipeline::run_trade_decision(ref, cargo, snap.inputs, rule, fuel);
    print_trade_note(pack, snap);

    std::optional<dvb::risk::RiskPack> risk_pack;
    if (want_stress) {
      risk_pack = dvb::risk::run_stress_test(pack.decision, ref, cargo, snap.inputs, rule, stress, fuel);
      print_risk_pack(*risk_pack);
    }

    if (want_save) {
      const QString dir = QString::fromStdString(out_dir);
      const QDateTime now = QDateTime::currentDateTimeUtc();
      QString err;
      std::string serr;
      const QString pack_path   = dvb::io::report_path(dir, "trade_pack", "json", now);
      const QString ticket_path = dvb::io::report_path(dir, "trade_ticket", "csv", now);
      if (!dvb::io::write_json(pack_path, dvb::io::trade_pack_to_json(pack), &err)) {
        std::cerr << "Save failed: " << err.toStdString() << "\n";
        return kExitIo;
      }
      if (!dvb::io::write_trade_ticket_csv(ticket_path.toStdString(), pack, &serr)) {
        std::cerr << "Save failed: " << serr << "\n";
        return kExitIo;
      }
      std::cout << "Saved: " << pack_path.toStdString() << "\n"
                << "Saved: " << ticket_path.toStdString() << "\n";

      if (risk_pack) {
        const QString risk_path   = dvb::io::report_path(dir, "risk_report", "json", now);
        const QString stress_path = dvb::io::report_path(dir, "stress_pack", "csv", now);
        const QString eval_date   = now.toString(Qt::ISODate);
        if (!dvb::io::write_json(risk_path, dvb::io::risk_pack_to_json(*risk_pack, eval_date), &err)) {
          std::cerr << "Save failed: " << err.toStdString() << "\n";
          return kExitIo;
        }
        if (!dvb::io::write_stress_csv(stress_path.toStdString(), *risk_pack, &serr)) {
          std::cerr << "Save failed: " << serr << "\n";
          return kExitIo;
        }
        std::cout << "Saved: " << risk_path.toStdString() << "\n"
                  << "Saved: " << stress_path.toStdString() << "\n";
      }
    }
  } catch (const dvb::core::NotFoundError& e) {
    std::cerr << "Not found: " << e.key() << " (" << e.what() << ")\n";
    return kExitDomain;
  } catch (const std::invalid_argument& e) {
    // InvalidConfigError, EmptyInputError
    std::cerr << "Error: " << e.what() << "\n";
    return kExitDomain;
  }
  return 0;
}
