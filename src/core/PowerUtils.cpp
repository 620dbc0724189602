#include "core/PowerUtils.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <stdexcept>

namespace power {

double run_cost(double speed, double grade) {
  const double g = std::clamp(grade, -kMaxGrade, kMaxGrade);
  const double c_i = 155.4 * std::pow(g, 5) - 30.4 * std::pow(g, 4) -
                     43.3 * std::pow(g, 3) + 46.3 * g * g + 19.5 * g + 3.6;
  const double c_aero = kAirFriction / kAeroEfficiency * speed * speed;
  return c_i + c_aero;
}

std::vector<double> run_power(const std::vector<double> &speeds,
                              const std::vector<double> &grades) {
  std::vector<double> out(speeds.size());
  for (std::size_t i = 0; i < speeds.size(); ++i) {
    double g = i < grades.size() ? grades[i] : 0.0;
    if (!std::isfinite(g))
      g = 0.0;
    out[i] = run_cost(speeds[i], g) * speeds[i];
  }
  return out;
}

double speed_from_pace(const std::string &pace) {
  int minutes = 0, seconds = 0;
  char tail = 0;
  if (std::sscanf(pace.c_str(), "%d:%d%c", &minutes, &seconds, &tail) != 2 ||
      minutes < 0 || seconds < 0 || seconds > 59)
    throw std::invalid_argument("pace must look like M:SS, got '" + pace +
                                "'");
  const int total = minutes * 60 + seconds;
  if (total == 0)
    throw std::invalid_argument("pace must be non-zero");
  return kMetresPerMile / total;
}

double flat_run_power(const std::string &pace) {
  return flat_run_power(speed_from_pace(pace));
}

double flat_run_power(double speed) { return run_cost(speed) * speed; }

// closed-form root of 0.02 v^3 + 3.6 v - P = 0
double flat_speed(double power) {
  const double value = std::sqrt(25 * power * power + 8640) + 5 * power;
  return (std::cbrt(5.0) * std::pow(value, 2.0 / 3.0) -
          12 * std::pow(5.0, 2.0 / 3.0)) /
         std::cbrt(value);
}

double air_friction_coefficient(double cd, double mass, double proj_area,
                                double density_air) {
  return 0.5 * cd * density_air * proj_area / mass;
}

std::vector<double> moving_average(const std::vector<double> &x,
                                   std::size_t window) {
  std::vector<double> out(x.size());
  if (window == 0)
    window = 1;
  double sum = 0.0;
  for (std::size_t i = 0; i < x.size(); ++i) {
    sum += x[i];
    if (i >= window)
      sum -= x[i - window];
    const std::size_t count = std::min(i + 1, window);
    out[i] = sum / static_cast<double>(count);
  }
  return out;
}

} // namespace power
