#pragma once
#include "core/ElevationService.hpp"
#include "core/FieldRegistry.hpp"
#include "models/CanonicalTable.hpp"
#include "models/params.hpp"
#include <optional>
#include <vector>

// Where a whole-activity statistic is read from.
enum class StatSource : uint8_t { Records, Summary, Laps };

// A decoded recording segmented into movement blocks, plus the metrics
// derived from it.
//
// Construction runs the whole pipeline (threshold detection, event merge,
// segmentation, table build and hygiene) and throws on structural problems:
// EmptyInputError, DataIntegrityError, NotSupportedError,
// UnitAmbiguityError. Metric accessors never throw for missing data; they
// return std::nullopt (or nullptr for series).
//
// Derived series and scalars are computed on first use and cached. An
// Activity is not safe to share between threads.
class Activity {
public:
  Activity(SampleStream records, std::vector<Event> device_events,
           ActivityParams params = ActivityParams{},
           const ElevationService *elevation = nullptr);
  explicit Activity(DecodedActivity decoded,
                    ActivityParams params = ActivityParams{},
                    const ElevationService *elevation = nullptr);

  const CanonicalTable &table() const { return table_; }
  const ActivityParams &params() const { return params_; }
  const Json &summary() const { return summary_; }
  const std::vector<Json> &laps() const { return laps_; }
  const FieldRegistry &fields() const { return fields_; }
  const std::vector<Event> &timeline() const { return timeline_; }

  // Registry shortcut: stream("grade"), stream("heart_rate"), ...
  const std::vector<double> *stream(const std::string &name) const {
    return fields_.stream(*this, name);
  }

  bool has_field(Field f) const { return table_.has(f); }
  bool has_position() const;
  bool has_run_power() const;

  // ---- Time (seconds) ----
  double start_time() const { return start_time_; }
  double end_time() const { return end_time_; }
  double elapsed_time() const { return end_time_ - start_time_; }
  double moving_time() const;
  int block_count() const { return table_.block_count(); }
  std::size_t excised_count() const;

  // ---- Filtered series ----
  // With remove_stopped_periods, rows at or below the stopped threshold are
  // left out. Excised rows retained for debugging are always left out.
  std::optional<std::vector<double>> power() const;
  std::optional<std::vector<double>> heart_rate() const;
  std::optional<std::vector<double>> cadence() const;

  // Smoothed (or raw, per params) grade per row. Needs distance and
  // elevation.
  const std::vector<double> *grade() const;
  // Metabolic running power per row (W/kg). Needs speed and distance.
  const std::vector<double> *run_power() const;
  // Cumulative haversine distance along the recorded track.
  std::optional<std::vector<double>> distance_from_position() const;

  // ---- Scalars ----
  std::optional<double> mean_power() const;
  std::optional<double> mean_heart_rate() const;
  std::optional<double> mean_cadence() const;
  std::optional<double> norm_power() const;
  std::optional<double> intensity(std::optional<double> threshold_power) const;
  std::optional<double>
  training_stress(std::optional<double> threshold_power) const;
  std::optional<double>
  hr_intensity(std::optional<double> threshold_heart_rate) const;
  std::optional<double>
  hr_training_stress(std::optional<double> threshold_heart_rate) const;

  std::optional<double>
  total_distance(StatSource source = StatSource::Records) const;
  std::optional<double>
  elevation_gain(StatSource source = StatSource::Records) const;
  std::optional<double>
  elevation_loss(StatSource source = StatSource::Records) const;

private:
  ActivityParams params_;
  CanonicalTable table_;
  std::vector<Event> timeline_;
  Json summary_ = Json::object();
  std::vector<Json> laps_;
  double start_time_ = 0.0;
  double end_time_ = 0.0;
  FieldRegistry fields_;

  // compute-once caches
  mutable std::optional<double> moving_time_;
  mutable std::optional<std::vector<double>> grade_;
  mutable std::optional<std::vector<double>> run_power_;
  mutable std::optional<double> norm_power_;
  mutable bool norm_power_done_ = false;

  void build(const SampleStream &records,
             const std::vector<Event> &device_events);
  void fill_elevation(const ElevationService &service);
  bool keep_row(std::size_t i) const;
  std::optional<std::vector<double>> select(Field f,
                                            bool positive_only) const;
  std::optional<double> summed_laps(const std::string &key) const;
};
