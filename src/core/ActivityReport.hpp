#pragma once
#include "core/Activity.hpp"
#include <optional>

struct ReportOptions {
  std::optional<double> threshold_power;
  std::optional<double> threshold_heart_rate;
  bool include_rows = false;
};

// JSON view of an activity: counts, times, metrics (null when unavailable),
// the merged event timeline, summary and laps, and optionally every row.
Json activity_report(const Activity &act, const ReportOptions &opt = {});

// Rows of the canonical table as objects; NaN cells become null.
Json table_rows_json(const CanonicalTable &t);
