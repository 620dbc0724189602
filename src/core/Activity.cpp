// Activity wires the segmentation pipeline together and exposes the derived
// metrics of one recording.

#include "core/Activity.hpp"
#include "core/EventMerger.hpp"
#include "core/PowerUtils.hpp"
#include "core/SegmentationEngine.hpp"
#include "core/SpatialUtils.hpp"
#include "core/StressUtils.hpp"
#include "core/TableBuilder.hpp"
#include "core/ThresholdDetector.hpp"
#include "models/Errors.hpp"
#include "models/Units.hpp"
#include <cmath>
#include <iostream>
#include <limits>
#include <numeric>

static constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

static std::optional<double> mean_of(const std::optional<std::vector<double>> &v) {
  if (!v || v->empty())
    return std::nullopt;
  return std::accumulate(v->begin(), v->end(), 0.0) /
         static_cast<double>(v->size());
}

static std::optional<double> last_finite(const std::vector<double> &v) {
  for (std::size_t i = v.size(); i-- > 0;) {
    if (std::isfinite(v[i]))
      return v[i];
  }
  return std::nullopt;
}

Activity::Activity(SampleStream records, std::vector<Event> device_events,
                   ActivityParams params, const ElevationService *elevation)
    : params_(params) {
  build(records, device_events);
  if (elevation)
    fill_elevation(*elevation);
}

Activity::Activity(DecodedActivity decoded, ActivityParams params,
                   const ElevationService *elevation)
    : params_(params), summary_(std::move(decoded.summary)),
      laps_(std::move(decoded.laps)) {
  build(decoded.records, decoded.events);
  if (elevation)
    fill_elevation(*elevation);
}

// ===== construction =====

void Activity::build(const SampleStream &records,
                     const std::vector<Event> &device_events) {
  if (records.samples.empty())
    throw EmptyInputError("activity has no samples");
  start_time_ = records.samples.front().timestamp;
  end_time_ = records.samples.back().timestamp;

  // 1) event timeline: device events, plus detected ones when stationary
  //    periods are to be removed
  std::vector<Event> detected;
  if (params_.remove_stopped_periods) {
    const double scale = UnitFactor(Field::Speed, records.unit(Field::Speed));
    ThresholdDetector detector(params_.stopped_threshold, scale);
    detected = detector.detect(records.samples);
  }
  timeline_ = merge_events(device_events, detected);

  // 2) blocks, 3) table + hygiene
  auto assignments =
      SegmentationEngine::assign_blocks(records.samples, timeline_);
  table_ = TableBuilder(params_.retain_excised).build(records, assignments);
}

void Activity::fill_elevation(const ElevationService &service) {
  if (table_.has(Field::Elevation) || !has_position())
    return;

  const auto &lat = table_.column(Field::Latitude)->values;
  const auto &lon = table_.column(Field::Longitude)->values;
  std::vector<std::size_t> rows;
  std::vector<Coordinate> coords;
  for (std::size_t i = 0; i < table_.size(); ++i) {
    if (std::isfinite(lat[i]) && std::isfinite(lon[i])) {
      rows.push_back(i);
      coords.push_back({lat[i], lon[i]});
    }
  }
  if (coords.empty())
    return;

  std::vector<double> elevs = service.lookup(coords);
  if (elevs.size() != coords.size())
    throw std::runtime_error("elevation service returned " +
                             std::to_string(elevs.size()) + " values for " +
                             std::to_string(coords.size()) + " points");

  Column col{CanonicalUnit(Field::Elevation),
             std::vector<double>(table_.size(), kNaN)};
  for (std::size_t k = 0; k < rows.size(); ++k)
    col.values[rows[k]] = elevs[k];
  table_.columns[Field::Elevation] = std::move(col);
  TableBuilder::fill_elevation(table_);
  std::cerr << "[elevation] filled " << coords.size() << " points\n";
}

// ===== row selection =====

bool Activity::has_position() const {
  return table_.has(Field::Latitude) && table_.has(Field::Longitude);
}

bool Activity::has_run_power() const {
  return table_.has(Field::Speed) && table_.has(Field::Distance);
}

bool Activity::keep_row(std::size_t i) const {
  if (table_.excised(i))
    return false;
  if (!params_.remove_stopped_periods)
    return true;
  const Column *speed = table_.column(Field::Speed);
  return !speed || speed->values[i] > params_.stopped_threshold;
}

std::optional<std::vector<double>> Activity::select(Field f,
                                                    bool positive_only) const {
  const Column *c = table_.column(f);
  if (!c)
    return std::nullopt;
  std::vector<double> out;
  out.reserve(c->values.size());
  for (std::size_t i = 0; i < c->values.size(); ++i) {
    const double v = c->values[i];
    if (!std::isfinite(v) || !keep_row(i))
      continue;
    if (positive_only && v <= 0)
      continue;
    out.push_back(v);
  }
  return out;
}

std::size_t Activity::excised_count() const {
  std::size_t n = 0;
  for (std::size_t i = 0; i < table_.size(); ++i) {
    if (table_.excised(i))
      ++n;
  }
  return n;
}

// ===== time =====

double Activity::moving_time() const {
  if (!moving_time_) {
    double total = 0.0;
    bool have_prev = false;
    std::size_t prev = 0;
    for (std::size_t i = 0; i < table_.size(); ++i) {
      if (table_.excised(i))
        continue;
      // first row of each block contributes nothing
      if (have_prev && table_.block[prev] == table_.block[i])
        total += table_.timestamp[i] - table_.timestamp[prev];
      prev = i;
      have_prev = true;
    }
    moving_time_ = total;
  }
  return *moving_time_;
}

// ===== series =====

std::optional<std::vector<double>> Activity::power() const {
  return select(Field::Power, false);
}

std::optional<std::vector<double>> Activity::heart_rate() const {
  return select(Field::HeartRate, false);
}

std::optional<std::vector<double>> Activity::cadence() const {
  return select(Field::Cadence, true);
}

const std::vector<double> *Activity::grade() const {
  if (grade_)
    return &*grade_;
  const Column *dist = table_.column(Field::Distance);
  const Column *elev = table_.column(Field::Elevation);
  if (!dist || !elev)
    return nullptr;

  grade_ = params_.smooth_grade
               ? SpatialUtils::grade_smooth(dist->values, elev->values)
               : SpatialUtils::grade_raw(dist->values, elev->values);
  return &*grade_;
}

const std::vector<double> *Activity::run_power() const {
  if (run_power_)
    return &*run_power_;
  if (!has_run_power())
    return nullptr;

  // no elevation: flat ground
  const std::vector<double> *g = grade();
  run_power_ = power::run_power(table_.column(Field::Speed)->values,
                                g ? *g : std::vector<double>{});
  return &*run_power_;
}

std::optional<std::vector<double>> Activity::distance_from_position() const {
  if (!has_position())
    return std::nullopt;
  return SpatialUtils::distance_from_position(
      table_.column(Field::Latitude)->values,
      table_.column(Field::Longitude)->values);
}

// ===== scalars =====

std::optional<double> Activity::mean_power() const {
  if (has_field(Field::Power))
    return mean_of(power());
  if (const auto *rp = run_power()) {
    std::vector<double> kept;
    for (std::size_t i = 0; i < rp->size(); ++i) {
      if (keep_row(i) && std::isfinite((*rp)[i]))
        kept.push_back((*rp)[i]);
    }
    return mean_of(kept);
  }
  return std::nullopt;
}

std::optional<double> Activity::mean_heart_rate() const {
  return mean_of(heart_rate());
}

std::optional<double> Activity::mean_cadence() const {
  return mean_of(cadence());
}

std::optional<double> Activity::norm_power() const {
  if (norm_power_done_)
    return norm_power_;
  norm_power_done_ = true;

  std::vector<double> p;
  if (has_field(Field::Power)) {
    p = *power();
  } else if (const auto *rp = run_power()) {
    for (std::size_t i = 0; i < rp->size(); ++i) {
      if (keep_row(i) && std::isfinite((*rp)[i]))
        p.push_back((*rp)[i]);
    }
  }
  if (p.empty())
    return norm_power_ = std::nullopt;

  norm_power_ = stress::lactate_norm(power::moving_average(p, 30));
  return norm_power_;
}

std::optional<double>
Activity::intensity(std::optional<double> threshold_power) const {
  if (!threshold_power || !(*threshold_power > 0))
    return std::nullopt;
  auto np = norm_power();
  if (!np)
    return std::nullopt;
  return *np / *threshold_power;
}

std::optional<double>
Activity::training_stress(std::optional<double> threshold_power) const {
  auto if_ = intensity(threshold_power);
  if (!if_)
    return std::nullopt;
  return stress::training_stress(*if_, moving_time());
}

std::optional<double>
Activity::hr_intensity(std::optional<double> threshold_heart_rate) const {
  if (!threshold_heart_rate || !(*threshold_heart_rate > 0))
    return std::nullopt;
  auto hr = heart_rate();
  if (!hr || hr->empty())
    return std::nullopt;
  return stress::lactate_norm(*hr) / *threshold_heart_rate;
}

std::optional<double>
Activity::hr_training_stress(std::optional<double> threshold_heart_rate) const {
  auto if_ = hr_intensity(threshold_heart_rate);
  if (!if_)
    return std::nullopt;
  return stress::training_stress(*if_, moving_time());
}

std::optional<double> Activity::summed_laps(const std::string &key) const {
  if (laps_.empty())
    return std::nullopt;
  double total = 0.0;
  bool any = false;
  for (const auto &lap : laps_) {
    auto it = lap.find(key);
    if (it != lap.end() && it->is_number()) {
      total += it->get<double>();
      any = true;
    }
  }
  return any ? std::optional<double>(total) : std::nullopt;
}

std::optional<double> Activity::total_distance(StatSource source) const {
  switch (source) {
  case StatSource::Summary:
    return fields_.summary(*this, "distance", "total");
  case StatSource::Laps:
    return summed_laps("distance_total");
  case StatSource::Records:
    if (const Column *d = table_.column(Field::Distance))
      return last_finite(d->values);
    if (auto d = distance_from_position())
      return last_finite(*d);
    return std::nullopt;
  }
  return std::nullopt;
}

std::optional<double> Activity::elevation_gain(StatSource source) const {
  switch (source) {
  case StatSource::Summary:
    return fields_.summary(*this, "elevation", "gain");
  case StatSource::Laps:
    return summed_laps("elevation_gain");
  case StatSource::Records:
    if (const Column *e = table_.column(Field::Elevation))
      return SpatialUtils::elevation_gain(e->values);
    return std::nullopt;
  }
  return std::nullopt;
}

std::optional<double> Activity::elevation_loss(StatSource source) const {
  switch (source) {
  case StatSource::Summary:
    return fields_.summary(*this, "elevation", "loss");
  case StatSource::Laps:
    return summed_laps("elevation_loss");
  case StatSource::Records:
    if (const Column *e = table_.column(Field::Elevation))
      return SpatialUtils::elevation_loss(e->values);
    return std::nullopt;
  }
  return std::nullopt;
}
