#include "ThresholdDetector.hpp"

std::vector<Event>
ThresholdDetector::detect(const std::vector<Sample> &samples) const {
  std::vector<Event> events;
  bool stopped = false;

  for (std::size_t i = 0; i < samples.size(); ++i) {
    const Sample &s = samples[i];
    // bootstrap: the recording always opens a block
    if (i == 0) {
      events.push_back(
          {s.timestamp, EventKind::Start, EventProvenance::Detected, "start"});
      continue;
    }

    auto speed = s.get(Field::Speed);
    if (!speed)
      continue;

    const double v = *speed * speed_scale_;
    if (v <= threshold_ && !stopped) {
      events.push_back(
          {s.timestamp, EventKind::Stop, EventProvenance::Detected, "stop"});
      stopped = true;
    } else if (v > threshold_ && stopped) {
      events.push_back(
          {s.timestamp, EventKind::Start, EventProvenance::Detected, "start"});
      stopped = false;
    }
  }
  return events;
}
