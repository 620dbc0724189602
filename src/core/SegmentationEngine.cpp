// SegmentationEngine assigns samples to movement blocks.

#include "SegmentationEngine.hpp"
#include "models/Errors.hpp"

void SegmentationEngine::apply(const Event &e) {
  if (e.kind == EventKind::Start) {
    ++current_block_;
    excising_ = false;
  } else if (e.provenance == EventProvenance::Detected) {
    excising_ = true;
  }
  // device stops leave the state untouched
}

BlockAssignment SegmentationEngine::advance(double timestamp) {
  while (cursor_ < timeline_.size() &&
         timeline_[cursor_].timestamp <= timestamp) {
    apply(timeline_[cursor_]);
    ++cursor_;
  }
  return {current_block_, excising_};
}

void SegmentationEngine::reset() noexcept {
  cursor_ = 0;
  current_block_ = -1;
  excising_ = false;
}

std::vector<BlockAssignment>
SegmentationEngine::assign_blocks(const std::vector<Sample> &samples,
                                  const std::vector<Event> &timeline) {
  if (samples.empty())
    throw EmptyInputError("cannot segment: no samples");
  if (timeline.empty())
    throw EmptyInputError("cannot segment: no start/stop events");

  SegmentationEngine engine(timeline);
  std::vector<BlockAssignment> out;
  out.reserve(samples.size());
  for (const auto &s : samples)
    out.push_back(engine.advance(s.timestamp));
  return out;
}
