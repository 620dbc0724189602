#pragma once
#include <cmath>
#include <vector>

// Training-stress helpers usable with any intensity series (power, heart
// rate, speed).
namespace stress {

// 4th-power mean: sqrt(sqrt(mean(x^4))). NaN for an empty series.
inline double lactate_norm(const std::vector<double> &x) {
  if (x.empty())
    return std::nan("");
  double acc = 0.0;
  for (double v : x)
    acc += v * v * v * v;
  return std::sqrt(std::sqrt(acc / static_cast<double>(x.size())));
}

// 100 points for one hour at threshold intensity.
inline double training_stress(double intensity, double moving_time_s) {
  return 100.0 * (moving_time_s / 3600.0) * intensity * intensity;
}

} // namespace stress
