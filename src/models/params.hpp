#pragma once

#include <nlohmann/json.hpp>
#include <string>

// User-supplied parameters controlling segmentation and metric derivation.
struct ActivityParams {
  bool remove_stopped_periods = true;
  double stopped_threshold = 0.3; // m/s
  bool retain_excised = false;    // debug: keep excised rows, flag them
  bool smooth_grade = true;

  static ActivityParams from_json(const nlohmann::json &j) {
    ActivityParams p;
    if (j.contains("remove_stopped_periods"))
      p.remove_stopped_periods = j.at("remove_stopped_periods").get<bool>();
    if (j.contains("stopped_threshold"))
      p.stopped_threshold = j.at("stopped_threshold").get<double>();
    if (j.contains("retain_excised"))
      p.retain_excised = j.at("retain_excised").get<bool>();
    if (j.contains("smooth_grade"))
      p.smooth_grade = j.at("smooth_grade").get<bool>();
    return p;
  }
};
