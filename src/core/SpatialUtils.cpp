#include "core/SpatialUtils.hpp"
#include "core/filters/SavitzkyGolay.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

static constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

double SpatialUtils::haversine(double lon1, double lon2, double lat1,
                               double lat2) {
  double phi1 = lat1 * (M_PI / 180);
  double phi2 = lat2 * (M_PI / 180);
  double delta_phi = (lat2 - lat1) * (M_PI / 180);
  double delta_lambda = (lon2 - lon1) * (M_PI / 180);
  double h = std::pow(std::sin(delta_phi / 2), 2) +
             std::cos(phi1) * std::cos(phi2) *
                 std::pow(std::sin(delta_lambda / 2), 2);
  return 2 * 6371000 * std::asin(std::sqrt(h));
}

double SpatialUtils::haversine(const Coordinate &p1, const Coordinate &p2) {
  return haversine(p1.lon, p2.lon, p1.lat, p2.lat);
}

std::vector<double>
SpatialUtils::distance_from_position(const std::vector<double> &lat,
                                     const std::vector<double> &lon) {
  const std::size_t n = std::min(lat.size(), lon.size());
  std::vector<double> la(lat.begin(), lat.begin() + n);
  std::vector<double> lo(lon.begin(), lon.begin() + n);
  // backfill gaps in the track
  double next_la = kNaN, next_lo = kNaN;
  for (std::size_t i = n; i-- > 0;) {
    if (std::isnan(la[i]) || std::isnan(lo[i])) {
      la[i] = next_la;
      lo[i] = next_lo;
    } else {
      next_la = la[i];
      next_lo = lo[i];
    }
  }

  std::vector<double> out(n, 0.0);
  for (std::size_t i = 1; i < n; ++i) {
    double step = haversine(lo[i - 1], lo[i], la[i - 1], la[i]);
    if (!std::isfinite(step))
      step = 0.0;
    out[i] = out[i - 1] + step;
  }
  return out;
}

std::vector<double>
SpatialUtils::grade_raw(const std::vector<double> &distance,
                        const std::vector<double> &elevation) {
  const std::size_t n = std::min(distance.size(), elevation.size());
  std::vector<double> g(n, kNaN);
  for (std::size_t i = 1; i < n; ++i) {
    const double dy = elevation[i] - elevation[i - 1];
    const double dx = distance[i] - distance[i - 1];
    g[i] = dy / dx;
  }
  return g;
}

double SpatialUtils::median(std::vector<double> v) {
  if (v.empty())
    return kNaN;
  const std::size_t mid = v.size() / 2;
  std::nth_element(v.begin(), v.begin() + mid, v.end());
  double hi = v[mid];
  if (v.size() % 2 == 1)
    return hi;
  double lo = *std::max_element(v.begin(), v.begin() + mid);
  return 0.5 * (lo + hi);
}

void SpatialUtils::interpolate_nan(std::vector<double> &y) {
  const std::size_t n = y.size();
  std::size_t first = n;
  for (std::size_t i = 0; i < n; ++i) {
    if (!std::isnan(y[i])) {
      first = i;
      break;
    }
  }
  if (first == n)
    return; // nothing to anchor on

  for (std::size_t i = 0; i < first; ++i)
    y[i] = y[first];

  std::size_t last = first;
  for (std::size_t i = first + 1; i < n; ++i) {
    if (std::isnan(y[i]))
      continue;
    const double span = static_cast<double>(i - last);
    for (std::size_t k = last + 1; k < i; ++k) {
      const double t = static_cast<double>(k - last) / span;
      y[k] = y[last] + t * (y[i] - y[last]);
    }
    last = i;
  }
  for (std::size_t i = last + 1; i < n; ++i)
    y[i] = y[last];
}

std::vector<double>
SpatialUtils::interp_extrapolate(const std::vector<double> &x,
                                 const std::vector<double> &y,
                                 const std::vector<double> &xq) {
  std::vector<double> out(xq.size(), kNaN);
  if (x.empty())
    return out;
  if (x.size() == 1) {
    std::fill(out.begin(), out.end(), y.front());
    return out;
  }

  for (std::size_t q = 0; q < xq.size(); ++q) {
    const double g = xq[q];
    if (std::isnan(g))
      continue;
    // segment [i, i+1] containing g, clamped to the end segments
    auto it = std::upper_bound(x.begin(), x.end(), g);
    std::size_t i = (it == x.begin()) ? 0 : static_cast<std::size_t>(it - x.begin()) - 1;
    i = std::min(i, x.size() - 2);
    const double dx = x[i + 1] - x[i];
    const double t = dx > 0 ? (g - x[i]) / dx : 0.0;
    out[q] = y[i] + t * (y[i + 1] - y[i]);
  }
  return out;
}

std::vector<double>
SpatialUtils::elevation_smooth(const std::vector<double> &distance,
                               const std::vector<double> &elevation,
                               double bin_m, double outlier_m, int window,
                               int polyorder) {
  const std::size_t n = std::min(distance.size(), elevation.size());
  std::vector<double> smooth(elevation.begin(), elevation.begin() + n);

  double d_min = std::numeric_limits<double>::infinity();
  double d_max = -std::numeric_limits<double>::infinity();
  double d_last = kNaN;
  for (std::size_t i = 0; i < n; ++i) {
    if (std::isnan(distance[i]) || std::isnan(elevation[i]))
      continue;
    d_min = std::min(d_min, distance[i]);
    d_max = std::max(d_max, distance[i]);
    d_last = distance[i];
  }
  if (!(d_max > d_min) || !(bin_m > 0))
    return smooth; // degenerate: no distance covered

  // 1) Equal-width bins over [d_min, d_max], right-closed, the first edge
  //    nudged left so the minimum falls inside the first bin.
  const std::size_t n_bins = static_cast<std::size_t>(
      std::max(1.0, std::ceil(d_last / bin_m)));
  const double range = d_max - d_min;
  std::vector<double> edges(n_bins + 1);
  for (std::size_t k = 0; k <= n_bins; ++k)
    edges[k] = d_min + range * static_cast<double>(k) / n_bins;
  edges[0] -= range * 0.001;

  std::vector<std::vector<double>> members(n_bins);
  for (std::size_t i = 0; i < n; ++i) {
    const double d = distance[i];
    if (std::isnan(d) || std::isnan(elevation[i]))
      continue;
    auto it = std::lower_bound(edges.begin() + 1, edges.end(), d);
    std::size_t k = static_cast<std::size_t>(it - edges.begin()) - 1;
    k = std::min(k, n_bins - 1);
    members[k].push_back(elevation[i]);
  }

  std::vector<double> mids(n_bins), elev_ds(n_bins);
  for (std::size_t k = 0; k < n_bins; ++k) {
    mids[k] = 0.5 * (edges[k] + edges[k + 1]);
    elev_ds[k] = median(members[k]);
  }
  interpolate_nan(elev_ds);

  // 2) First filter pass, reject points the filter moved too far.
  filters::SavitzkyGolay sg(window, polyorder);
  std::vector<double> sg1 = sg.apply(elev_ds);
  for (std::size_t k = 0; k < n_bins; ++k) {
    if (std::fabs(elev_ds[k] - sg1[k]) > outlier_m)
      elev_ds[k] = kNaN;
  }
  interpolate_nan(elev_ds);

  // 3) Second pass, then back onto the original distances.
  std::vector<double> sg2 = sg.apply(elev_ds);
  std::vector<double> dq(distance.begin(), distance.begin() + n);
  return interp_extrapolate(mids, sg2, dq);
}

std::vector<double>
SpatialUtils::grade_smooth(const std::vector<double> &distance,
                           const std::vector<double> &elevation) {
  return grade_raw(distance, elevation_smooth(distance, elevation));
}

double SpatialUtils::elevation_gain(const std::vector<double> &elevation,
                                    double threshold_m) {
  double gain = 0.0;
  double ref = kNaN;
  for (double e : elevation) {
    if (std::isnan(e))
      continue;
    if (std::isnan(ref)) {
      ref = e;
      continue;
    }
    if (e - ref >= threshold_m) {
      gain += e - ref;
      ref = e;
    } else if (e < ref) {
      ref = e;
    }
  }
  return gain;
}

double SpatialUtils::elevation_loss(const std::vector<double> &elevation,
                                    double threshold_m) {
  std::vector<double> rev(elevation.rbegin(), elevation.rend());
  return elevation_gain(rev, threshold_m);
}
