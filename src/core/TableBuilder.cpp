// TableBuilder turns segmented samples into the canonical activity table.
//
// Only samples inside a block (block >= 0) are kept. Samples in a detected
// stationary period are dropped unless excised rows are retained for
// debugging, in which case an `excise` column flags them. After the rows are
// collected, columns that are null everywhere are dropped and the hygiene
// passes normalize units and repair nulls in a fixed order.

#include "TableBuilder.hpp"
#include "models/Errors.hpp"
#include "models/Units.hpp"
#include <cmath>
#include <iostream>
#include <limits>
#include <sstream>

static constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

// --- helper: backward fill, each null takes the next non-null value
static void backfill(std::vector<double> &v) {
  double next = kNaN;
  for (std::size_t i = v.size(); i-- > 0;) {
    if (std::isnan(v[i]))
      v[i] = next;
    else
      next = v[i];
  }
}

static bool all_null(const std::vector<double> &v) {
  for (double x : v) {
    if (!std::isnan(x))
      return false;
  }
  return true;
}

std::vector<bool>
TableBuilder::check_timestamps(const std::vector<Sample> &samples) {
  std::vector<bool> duplicate(samples.size(), false);
  for (std::size_t i = 0; i < samples.size(); ++i) {
    const double ts = samples[i].timestamp;
    if (!std::isfinite(ts)) {
      std::ostringstream os;
      os << "malformed timestamp at sample " << i;
      throw DataIntegrityError(os.str());
    }
    if (i == 0)
      continue;
    const double prev = samples[i - 1].timestamp;
    if (ts < prev) {
      std::ostringstream os;
      os << "timestamps go backwards at sample " << i << " (" << prev
         << " -> " << ts << ")";
      throw DataIntegrityError(os.str());
    }
    if (ts == prev) {
      if (samples[i].values != samples[i - 1].values) {
        std::ostringstream os;
        os << "conflicting samples share timestamp " << ts;
        throw DataIntegrityError(os.str());
      }
      duplicate[i] = true;
    }
  }
  return duplicate;
}

CanonicalTable
TableBuilder::build(const SampleStream &stream,
                    const std::vector<BlockAssignment> &assignments) const {
  const auto &samples = stream.samples;
  if (samples.empty())
    throw EmptyInputError("cannot build table: no samples");
  if (assignments.size() != samples.size())
    throw std::invalid_argument("one block assignment per sample required");

  const std::vector<bool> duplicate = check_timestamps(samples);

  CanonicalTable t;
  std::map<Field, std::vector<double>> cols;
  for (Field f : kAllFields)
    cols[f];

  std::size_t dropped_dups = 0;
  for (std::size_t i = 0; i < samples.size(); ++i) {
    const auto &a = assignments[i];
    if (a.block < 0)
      continue;
    if (a.excise && !retain_excised_)
      continue;
    if (duplicate[i]) {
      ++dropped_dups;
      continue;
    }

    t.block.push_back(a.block);
    t.timestamp.push_back(samples[i].timestamp);
    if (retain_excised_)
      t.excise.push_back(a.excise);
    for (Field f : kAllFields) {
      auto v = samples[i].get(f);
      cols[f].push_back(v ? *v : kNaN);
    }
  }
  if (dropped_dups > 0)
    std::cerr << "[table] collapsed " << dropped_dups
              << " duplicate sample(s)\n";

  if (!t.timestamp.empty()) {
    const double t0 = t.timestamp.front();
    t.offset.reserve(t.timestamp.size());
    for (double ts : t.timestamp)
      t.offset.push_back(ts - t0);
  }

  // Keep only fields with at least one value among the retained rows.
  for (auto &kv : cols) {
    if (all_null(kv.second))
      continue;
    t.columns[kv.first] = Column{stream.unit(kv.first), std::move(kv.second)};
  }

  apply_hygiene(t);
  return t;
}

// ---- Hygiene ----

void TableBuilder::normalize_units(CanonicalTable &t) {
  for (auto &kv : t.columns) {
    Column &c = kv.second;
    const double factor = UnitFactor(kv.first, c.unit);
    if (factor != 1.0) {
      for (double &v : c.values)
        v *= factor;
    }
    c.unit = CanonicalUnit(kv.first);
  }
}

void TableBuilder::repair_cadence_power(CanonicalTable &t) {
  Column *cad = t.column(Field::Cadence);
  Column *pwr = t.column(Field::Power);
  if (cad && pwr) {
    auto &c = cad->values;
    auto &p = pwr->values;
    for (std::size_t i = 0; i < c.size(); ++i) {
      const bool c_null = std::isnan(c[i]);
      const bool p_null = std::isnan(p[i]);
      if (c_null && p_null) {
        c[i] = 0.0;
        p[i] = 0.0;
      } else if (c_null && p[i] == 0.0) {
        c[i] = 0.0;
      } else if (p_null && c[i] == 0.0) {
        p[i] = 0.0;
      }
    }
  } else if (cad) {
    // no power to cross-check: assume no movement
    for (double &v : cad->values) {
      if (std::isnan(v))
        v = 0.0;
    }
  }
}

void TableBuilder::fill_elevation(CanonicalTable &t) {
  if (Column *elev = t.column(Field::Elevation))
    backfill(elev->values);
}

void TableBuilder::fill_speed_distance(CanonicalTable &t) {
  Column *speed = t.column(Field::Speed);
  Column *dist = t.column(Field::Distance);

  if (speed) {
    for (double &v : speed->values) {
      if (std::isnan(v))
        v = 0.0;
    }
  }
  if (dist) {
    backfill(dist->values);
    return;
  }

  const bool has_position =
      t.has(Field::Latitude) && t.has(Field::Longitude);
  if (speed && has_position)
    throw NotSupportedError(
        "distance is missing but speed and position are present; refusing to "
        "derive it");
}

void TableBuilder::apply_hygiene(CanonicalTable &t) {
  normalize_units(t);
  repair_cadence_power(t);
  fill_elevation(t);
  fill_speed_distance(t);
}
