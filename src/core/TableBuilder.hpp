#pragma once
#include "core/SegmentationEngine.hpp"
#include "models/CanonicalTable.hpp"

// Builds the canonical (block, offset) table from a sample stream and the
// per-sample block assignments, then runs the column hygiene passes.
class TableBuilder {
public:
  explicit TableBuilder(bool retain_excised = false)
      : retain_excised_(retain_excised) {}

  CanonicalTable build(const SampleStream &stream,
                       const std::vector<BlockAssignment> &assignments) const;

  // Throws DataIntegrityError on non-finite, decreasing or conflicting
  // timestamps. Returns a mask of exact duplicates to drop.
  static std::vector<bool> check_timestamps(const std::vector<Sample> &samples);

  // ---- Hygiene passes (run in this order by apply_hygiene) ----
  static void normalize_units(CanonicalTable &t);
  static void repair_cadence_power(CanonicalTable &t);
  static void fill_elevation(CanonicalTable &t);
  static void fill_speed_distance(CanonicalTable &t);
  static void apply_hygiene(CanonicalTable &t);

private:
  bool retain_excised_;
};
