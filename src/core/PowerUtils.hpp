#pragma once
#include <string>
#include <vector>

// Running power model: Minetti (2002) grade cost plus a Pugh / di Prampero
// aerodynamic term. Power is metabolic, in W/kg.
namespace power {

constexpr double kMaxGrade = 0.45;  // Minetti polynomial validity range
constexpr double kAirFriction = 0.01; // k, J s^2 m^-3 kg^-1
constexpr double kAeroEfficiency = 0.5;
constexpr double kMetresPerMile = 1609.34;

// Cost of running in J/kg/m. Grade is clamped to [-0.45, 0.45].
double run_cost(double speed, double grade = 0.0);

// Pointwise run_cost(v, g) * v. NaN or infinite grades count as flat.
// `grades` may be empty, meaning flat ground everywhere.
std::vector<double> run_power(const std::vector<double> &speeds,
                              const std::vector<double> &grades);

// Flat-ground power for a pace given as "M:SS" per mile.
double flat_run_power(const std::string &pace);
// Flat-ground power for a speed in m/s.
double flat_run_power(double speed);
// Inverse of flat_run_power(speed).
double flat_speed(double power);

// k for c_aero = k v^2 from drag coefficient, runner mass (kg), projected
// area (m^2) and local air density (kg/m^3).
double air_friction_coefficient(double cd, double mass, double proj_area,
                                double density_air);

// Pace "M:SS" per mile -> m/s. Throws std::invalid_argument on bad input.
double speed_from_pace(const std::string &pace);

// Trailing moving average over `window` samples; the first window-1 outputs
// average over what is available so far.
std::vector<double> moving_average(const std::vector<double> &x,
                                   std::size_t window);

} // namespace power
