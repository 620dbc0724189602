#include "EventMerger.hpp"

std::vector<Event> merge_events(const std::vector<Event> &device,
                                const std::vector<Event> &detected) {
  std::vector<Event> out;
  out.reserve(device.size() + detected.size());

  // Several device events at one instant collapse to the last of them.
  auto push_device = [&out](const Event &e) {
    if (!out.empty() && out.back().timestamp == e.timestamp)
      out.back() = e;
    else
      out.push_back(e);
  };

  std::size_t i = 0, j = 0;
  while (i < device.size() || j < detected.size()) {
    if (j >= detected.size()) {
      push_device(device[i++]);
    } else if (i >= device.size()) {
      const Event &d = detected[j++];
      if (out.empty() || out.back().timestamp != d.timestamp)
        out.push_back(d);
    } else if (device[i].timestamp <= detected[j].timestamp) {
      // equal timestamps: device first, the detected one is then dropped
      push_device(device[i++]);
    } else {
      const Event &d = detected[j++];
      if (out.empty() || out.back().timestamp != d.timestamp)
        out.push_back(d);
    }
  }
  return out;
}
