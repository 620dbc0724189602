#pragma once
#include "models/CoreTypes.hpp"
#include <vector>

// Distance, elevation and grade helpers. Series are plain vectors with NaN
// for missing values.
class SpatialUtils {
public:
  // haversine formulas (metres)
  static double haversine(double lon1, double lon2, double lat1, double lat2);
  static double haversine(const Coordinate &p1, const Coordinate &p2);

  // Cumulative great-circle distance along a lat/lon track, starting at 0.
  // Missing coordinates are backfilled from the next valid point.
  static std::vector<double>
  distance_from_position(const std::vector<double> &lat,
                         const std::vector<double> &lon);

  // Point-to-point grade dy/dx. First element is NaN; a zero dx gives +-inf
  // or NaN.
  static std::vector<double> grade_raw(const std::vector<double> &distance,
                                       const std::vector<double> &elevation);

  // Elevation profile smoothed for use in grade calculations:
  // median-downsampled into `bin_m` bins, passed through a Savitzky-Golay
  // filter, outliers beyond `outlier_m` replaced by interpolation, filtered
  // again and interpolated back onto `distance`.
  static std::vector<double>
  elevation_smooth(const std::vector<double> &distance,
                   const std::vector<double> &elevation, double bin_m = 30.0,
                   double outlier_m = 5.0, int window = 3, int polyorder = 2);

  static std::vector<double> grade_smooth(const std::vector<double> &distance,
                                          const std::vector<double> &elevation);

  // Total climb counting only rises that exceed `threshold_m` above the last
  // low point.
  static double elevation_gain(const std::vector<double> &elevation,
                               double threshold_m = 5.0);
  static double elevation_loss(const std::vector<double> &elevation,
                               double threshold_m = 5.0);

  // ---- interpolation helpers ----
  // Fill NaNs by linear interpolation over the index; leading and trailing
  // NaNs take the nearest valid value.
  static void interpolate_nan(std::vector<double> &y);
  // Piecewise-linear y(x) at `xq`, extrapolating past both ends. `x` must be
  // increasing.
  static std::vector<double> interp_extrapolate(const std::vector<double> &x,
                                                const std::vector<double> &y,
                                                const std::vector<double> &xq);
  static double median(std::vector<double> v);
};
