#include "dvb/config/decision_config.hpp"
#include "dvb/core/errors.hpp"
#include "dvb/decision/decision_engine.hpp"
#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>

using namespace dvb;
using decision::Decision;
using decision::Side;

int main() {
  constexpr double EPS = 1e-9;

  // 1) Uplift large -> DIVERT
  const auto r1 = decision::decide(100.0, 200.0, 100000.0, 0.05, 10.0, 20.0);
  assert(std::abs(r1.delta_netback_raw_usd - 100.0) < EPS);
  assert(std::abs(r1.delta_netback_adj_usd - 85.0) < EPS);
  assert(r1.decision == Decision::Divert);
  assert(r1.lots_a == 10 && r1.lots_b == 10);

  // jambes : achat du benchmark B, vente du benchmark A
  assert(r1.hedge_legs.size() == 2);
  assert(r1.hedge_legs[0].side == Side::Buy  && r1.hedge_legs[0].instrument == "JKM");
  assert(r1.hedge_legs[1].side == Side::Sell && r1.hedge_legs[1].instrument == "TTF");
  assert(r1.hedge_legs[0].lots == 10);

  // 2) Uplift faible -> KEEP, pas de jambe par défaut
  const auto r2 = decision::decide(100.0, 110.0, 100000.0, 0.05, 10.0, 20.0);
  assert(std::abs(r2.delta_netback_raw_usd - 10.0) < EPS);
  assert(std::abs(r2.delta_netback_adj_usd + 0.5) < EPS);
  assert(r2.decision == Decision::Keep);
  assert(r2.hedge_legs.empty());
  assert(r2.lots_a == 10); // taille calculée même sans jambe

  // 3) Frontière inclusive : delta_adj == buffer -> DIVERT
  const auto at = decision::decide(0.0, 1000.0, 0.0, 0.0, 100.0, 900.0);
  assert(at.delta_netback_adj_usd == 900.0);
  assert(at.decision == Decision::Divert);
  const auto above = decision::decide(0.0, 1000.0, 0.0, 0.0, 100.0, 900.5);
  assert(above.decision == Decision::Keep);

  // 4) Lots : arrondi inférieur, monotone, jamais négatif
  assert(decision::lots_for(99999.0, 10000.0) == 9);
  assert(decision::lots_for(100000.0, 10000.0) == 10);
  assert(decision::lots_for(9999.0, 10000.0) == 0);
  assert(decision::lots_for(-5000.0, 10000.0) == 0);
  assert(decision::lots_for(std::nan(""), 10000.0) == 0);
  std::int64_t prev = 0;
  for (double e = 0.0; e <= 250000.0; e += 3333.0) {
    const auto l = decision::lots_for(e, 10000.0);
    assert(l >= prev);
    prev = l;
  }

  // Quotient hors de la plage int64 : saturation, jamais de conversion indéfinie
  constexpr std::int64_t kMaxLots = std::numeric_limits<std::int64_t>::max();
  const double two63 = 9223372036854775808.0;
  assert(decision::lots_for(1e300, 1e-300) == kMaxLots);
  assert(decision::lots_for(std::numeric_limits<double>::infinity(), 1.0) == kMaxLots);
  assert(decision::lots_for(two63, 1.0) == kMaxLots);
  const double below = std::nextafter(two63, 0.0);
  assert(decision::lots_for(below, 1.0) == static_cast<std::int64_t>(below));
  assert(decision::lots_for(4611686018427387904.0, 1.0) == 4611686018427387904LL); // 2^62
  const auto huge = decision::decide(0.0, 1e9, 6e6, 0.0, 1.0, 1.0, 1e-15, 1e-15);
  assert(huge.decision == Decision::Divert);
  assert(huge.lots_a == kMaxLots && huge.lots_b == kMaxLots);
  assert(huge.hedge_legs.size() == 2 && huge.hedge_legs[0].lots == kMaxLots);

  // 5) Règle complète : politique KEEP inversée, benchmarks personnalisés
  config::DecisionRule rule;
  rule.basis_haircut_pct   = 0.05;
  rule.ops_buffer_usd      = 10.0;
  rule.decision_buffer_usd = 20.0;
  rule.lot_size_a          = 10000.0;
  rule.lot_size_b          = 25000.0;
  rule.keep_policy         = config::KeepHedgePolicy::Reverse;
  const auto rev = decision::decide(100.0, 110.0, 100000.0, rule);
  assert(rev.decision == Decision::Keep);
  assert(rev.hedge_legs.size() == 2);
  assert(rev.hedge_legs[0].side == Side::Buy  && rev.hedge_legs[0].instrument == "TTF" && rev.hedge_legs[0].lots == 10);
  assert(rev.hedge_legs[1].side == Side::Sell && rev.hedge_legs[1].instrument == "JKM" && rev.hedge_legs[1].lots == 4);

  // 6) Énergie couverte
  netback::NetbackPair pair{};
  pair.a.delivered_energy_mmbtu = 4000000.0;
  pair.a.netback_usd            = 1.0e8;
  pair.b.delivered_energy_mmbtu = 3900000.0;
  pair.b.netback_usd            = 1.1e8;
  config::DecisionRule hr;
  hr.coverage_pct = 0.5;
  assert(std::abs(decision::hedge_energy(pair, hr) - 2000000.0) < EPS);
  hr.hedge_basis = config::HedgeEnergyBasis::StrongerDestination;
  assert(std::abs(decision::hedge_energy(pair, hr) - 1950000.0) < EPS);
  pair.b.netback_usd = pair.a.netback_usd; // égalité -> B
  assert(std::abs(decision::hedge_energy(pair, hr) - 1950000.0) < EPS);

  // 7) Paramètres hors domaine : erreur avant tout calcul
  auto expect_invalid = [](double haircut, double ops, double buf, double lot) {
    bool thrown = false;
    try { (void)decision::decide(100.0, 200.0, 1000.0, haircut, ops, buf, lot, lot); }
    catch (const core::InvalidConfigError&) { thrown = true; }
    assert(thrown);
  };
  expect_invalid(5.0, 10.0, 20.0, 10000.0);   // décote en pourcent
  expect_invalid(-0.1, 10.0, 20.0, 10000.0);
  expect_invalid(0.05, 0.0, 20.0, 10000.0);
  expect_invalid(0.05, 10.0, -1.0, 10000.0);
  expect_invalid(0.05, 10.0, 20.0, 0.0);

  // 8) Pureté : mêmes entrées, mêmes sorties
  const auto again = decision::decide(100.0, 200.0, 100000.0, 0.05, 10.0, 20.0);
  assert(again.delta_netback_adj_usd == r1.delta_netback_adj_usd);
  assert(again.decision == r1.decision && again.lots_b == r1.lots_b);

  std::cout << "Decision engine OK.\n";
  return 0;
}
