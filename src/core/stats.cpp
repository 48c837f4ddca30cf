#include <dvb/core/stats.hpp>

#include <cmath>    // std::sqrt
#include <limits>   // std::numeric_limits

namespace dvb {
namespace core {

RunningStats::RunningStats() noexcept = default;

void RunningStats::add(double x) noexcept {
  n_ += 1;
  const double delta  = x - mean_;
  mean_ += delta / static_cast<double>(n_);
  const double delta2 = x - mean_;
  m2_   += delta * delta2;
}

std::size_t RunningStats::count() const noexcept {
  return n_;
}

double RunningStats::mean() const noexcept {
  return mean_;
}

double RunningStats::variance() const noexcept {
  if (n_ < 2) {
    return std::numeric_limits<double>::quiet_NaN(); // politique: indéfini si n<2
  }
  return m2_ / static_cast<double>(n_ - 1);
}

double RunningStats::std_dev() const noexcept {
  return std::sqrt(variance()); // NaN propagé si n<2
}

} // namespace core
} // namespace dvb
