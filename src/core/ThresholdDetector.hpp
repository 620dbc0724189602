#pragma once
#include "models/CoreTypes.hpp"
#include <vector>

// Speed-threshold start/stop detection
//------------------------------------------------------------------------------
// Emits a start at the first sample, a stop at the first sample whose speed
// drops to or below the threshold, and a start at the first sample whose speed
// rises back above it. Samples without speed never cause a transition.
class ThresholdDetector {
public:
  explicit ThresholdDetector(double threshold_mps = 0.3,
                             double speed_scale = 1.0)
      : threshold_(threshold_mps), speed_scale_(speed_scale) {}

  // `speed_scale` converts the stream's native speed unit to m/s.
  std::vector<Event> detect(const std::vector<Sample> &samples) const;

  double threshold() const noexcept { return threshold_; }

private:
  double threshold_;
  double speed_scale_;
};
