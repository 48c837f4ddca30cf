#pragma once
/**
 * @file stats.hpp
 * @brief Accumulateur statistique en streaming (Welford) pour les séries de P&L.
 *
 * - Algorithme de Welford : stable numériquement, une passe.
 * - Variance : échantillon (diviseur n-1), même convention que les métriques de backtest.
 * - Comportement aux petits n :
 *   - n == 0 : mean() = 0, variance() = NaN.
 *   - n == 1 : variance() = NaN (indéfinie), std_dev() = NaN.
 */

#include <cstddef> // std::size_t

namespace dvb {
namespace core {

struct RunningStats {
public:
  /// @brief Initialise les accumulateurs (n=0, mean=0, M2=0).
  RunningStats() noexcept;

  /// @brief Ajoute un échantillon.
  void add(double x) noexcept;

  /// @return Nombre d'échantillons vus.
  std::size_t count() const noexcept;

  /// @return Moyenne courante.
  double mean() const noexcept;

  /// @return Variance d'échantillon (diviseur n-1), NaN si n < 2.
  [[nodiscard]] double variance() const noexcept;

  /// @return Écart-type d'échantillon, NaN si n < 2.
  [[nodiscard]] double std_dev() const noexcept;

private:
  std::size_t n_{0};
  double mean_{0.0};
  double m2_{0.0}; // somme des carrés des écarts à la moyenne (Welford)
};

} // namespace core
} // namespace dvb
