#pragma once
#include "models/CoreTypes.hpp"
#include <vector>

// Movement segmentation
//
// Walks the sample stream once against a merged, sorted event timeline and
// tags every sample with the block it belongs to and whether it falls inside
// a detected stationary period.
//------------------------------------------------------------------------------

// Per-sample outcome. block == -1 means "before the first start".
struct BlockAssignment {
  int block = -1;
  bool excise = false;
};

class SegmentationEngine {
public:
  using index_t = std::size_t;

  // `timeline` must be sorted by timestamp; it is not checked here.
  explicit SegmentationEngine(const std::vector<Event> &timeline)
      : timeline_(timeline) {}

  // Consume every event at or before `timestamp`, then report the state.
  // Timestamps passed in must be non-decreasing.
  BlockAssignment advance(double timestamp);

  void reset() noexcept;

  int current_block() const noexcept { return current_block_; }
  bool excising() const noexcept { return excising_; }

  // One assignment per sample. Throws EmptyInputError when either input is
  // empty.
  static std::vector<BlockAssignment>
  assign_blocks(const std::vector<Sample> &samples,
                const std::vector<Event> &timeline);

private:
  const std::vector<Event> &timeline_;
  index_t cursor_ = 0;
  int current_block_ = -1;
  bool excising_ = false;

  void apply(const Event &e);
};
