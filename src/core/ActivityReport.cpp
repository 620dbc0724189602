#include "core/ActivityReport.hpp"
#include "io/TimeUtil.hpp"
#include "models/ActivityJson.hpp"
#include <cmath>

static Json opt_json(const std::optional<double> &v) {
  if (!v || !std::isfinite(*v))
    return nullptr;
  return *v;
}

Json table_rows_json(const CanonicalTable &t) {
  Json rows = Json::array();
  for (std::size_t i = 0; i < t.size(); ++i) {
    Json r = {{"block", t.block[i]},
              {"offset", t.offset[i]},
              {"timestamp", t.timestamp[i]}};
    for (const auto &kv : t.columns) {
      const double v = kv.second.values[i];
      r[FieldToString(kv.first)] = std::isnan(v) ? Json(nullptr) : Json(v);
    }
    if (t.has_excise())
      r["excise"] = static_cast<bool>(t.excise[i]);
    rows.push_back(std::move(r));
  }
  return rows;
}

Json activity_report(const Activity &act, const ReportOptions &opt) {
  const CanonicalTable &t = act.table();

  Json columns = Json::object();
  for (const auto &kv : t.columns)
    columns[FieldToString(kv.first)] = kv.second.unit;

  Json metrics = {
      {"mean_power", opt_json(act.mean_power())},
      {"norm_power", opt_json(act.norm_power())},
      {"intensity", opt_json(act.intensity(opt.threshold_power))},
      {"training_stress", opt_json(act.training_stress(opt.threshold_power))},
      {"mean_heart_rate", opt_json(act.mean_heart_rate())},
      {"hr_intensity", opt_json(act.hr_intensity(opt.threshold_heart_rate))},
      {"hr_training_stress",
       opt_json(act.hr_training_stress(opt.threshold_heart_rate))},
      {"mean_cadence", opt_json(act.mean_cadence())},
      {"total_distance", opt_json(act.total_distance())},
      {"elevation_gain", opt_json(act.elevation_gain())},
      {"elevation_loss", opt_json(act.elevation_loss())},
  };

  Json report = {
      {"rows", t.size()},
      {"blocks", act.block_count()},
      {"excised_rows", act.excised_count()},
      {"start_time", format_iso8601(act.start_time())},
      {"elapsed_s", act.elapsed_time()},
      {"moving_s", act.moving_time()},
      {"columns", columns},
      {"metrics", metrics},
      {"events", act.timeline()},
      {"summary", act.summary()},
      {"laps", act.laps()},
  };
  if (opt.include_rows)
    report["rows_data"] = table_rows_json(t);
  return report;
}
