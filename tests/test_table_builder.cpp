#include "core/EventMerger.hpp"
#include "core/SegmentationEngine.hpp"
#include "core/TableBuilder.hpp"
#include "core/ThresholdDetector.hpp"
#include "models/Errors.hpp"
#include "test_helpers.hpp"
#include <cmath>
#include <gtest/gtest.h>

using namespace testing_helpers;

namespace {

CanonicalTable build_table(const SampleStream &st,
                           const std::vector<Event> &device_events,
                           bool detect = true, bool retain = false) {
  std::vector<Event> det;
  if (detect)
    det = ThresholdDetector(0.3).detect(st.samples);
  auto tl = merge_events(device_events, det);
  auto a = SegmentationEngine::assign_blocks(st.samples, tl);
  return TableBuilder(retain).build(st, a);
}

std::vector<BlockAssignment> all_block0(std::size_t n) {
  return std::vector<BlockAssignment>(n, BlockAssignment{0, false});
}

} // namespace

// ---- concrete scenarios ----

TEST(TableBuilder, SteadyMovementIsOneBlock) {
  auto st = speed_stream(std::vector<double>(10, 2.0));
  auto t = build_table(st, {device(0, EventKind::Start)});
  EXPECT_EQ(t.size(), 10u);
  EXPECT_EQ(t.block_count(), 1);
  for (int b : t.block)
    EXPECT_EQ(b, 0);
  EXPECT_FALSE(t.has_excise());
}

TEST(TableBuilder, StationaryPeriodIsExcised) {
  auto st = speed_stream({2, 2, 2, 2, 2, 0.1, 0.1, 0.1, 2, 2});
  auto t = build_table(st, {});
  ASSERT_EQ(t.size(), 7u);
  EXPECT_EQ(t.block_count(), 2);
  const std::vector<int> blocks = {0, 0, 0, 0, 0, 1, 1};
  EXPECT_EQ(t.block, blocks);
  EXPECT_DOUBLE_EQ(t.timestamp[5], 8.0);
  EXPECT_DOUBLE_EQ(t.offset[6], 9.0);
}

TEST(TableBuilder, RetainExcisedKeepsFlaggedRows) {
  auto st = speed_stream({2, 2, 2, 2, 2, 0.1, 0.1, 0.1, 2, 2});
  auto t = build_table(st, {}, true, true);
  ASSERT_EQ(t.size(), 10u);
  ASSERT_TRUE(t.has_excise());
  int flagged = 0;
  for (std::size_t i = 0; i < t.size(); ++i)
    flagged += t.excised(i);
  EXPECT_EQ(flagged, 3);
  EXPECT_TRUE(t.excised(5));
  EXPECT_FALSE(t.excised(8));
}

TEST(TableBuilder, RowsBeforeFirstStartAreDropped) {
  auto st = speed_stream({1, 1, 1, 1, 1}, 100.0);
  auto t = build_table(st, {device(102, EventKind::Start)}, false);
  ASSERT_EQ(t.size(), 3u);
  EXPECT_DOUBLE_EQ(t.timestamp.front(), 102.0);
  // offsets count from the first retained row
  EXPECT_DOUBLE_EQ(t.offset.front(), 0.0);
  EXPECT_DOUBLE_EQ(t.offset.back(), 2.0);
}

TEST(TableBuilder, OffsetsAreNonDecreasing) {
  auto st = speed_stream({2, 0.1, 2, 0.1, 0.1, 2, 2, 0, 2});
  auto t = build_table(st, {});
  for (std::size_t i = 1; i < t.size(); ++i) {
    EXPECT_LE(t.offset[i - 1], t.offset[i]);
    EXPECT_LE(t.block[i - 1], t.block[i]);
  }
}

// ---- column set ----

TEST(TableBuilder, ColumnsAreUnionOfRetainedFields) {
  SampleStream st;
  st.samples.push_back(make_sample(0, {{Field::Speed, 1}, {Field::Distance, 0}}));
  st.samples.push_back(make_sample(1, {{Field::Speed, 1}, {Field::HeartRate, 120}}));
  st.samples.push_back(make_sample(2, {{Field::Speed, 1}, {Field::Distance, 2}}));
  auto t = TableBuilder().build(st, all_block0(3));
  EXPECT_TRUE(t.has(Field::Speed));
  EXPECT_TRUE(t.has(Field::HeartRate));
  EXPECT_TRUE(t.has(Field::Distance));
  EXPECT_FALSE(t.has(Field::Power));
  EXPECT_TRUE(std::isnan(t.column(Field::HeartRate)->values[0]));
}

TEST(TableBuilder, FieldOnlyInDroppedRowsIsNotAColumn) {
  SampleStream st;
  st.samples.push_back(make_sample(0, {{Field::Speed, 1}, {Field::Power, 200}}));
  st.samples.push_back(make_sample(1, {{Field::Speed, 1}}));
  std::vector<BlockAssignment> a = {{-1, false}, {0, false}};
  auto t = TableBuilder().build(st, a);
  EXPECT_EQ(t.size(), 1u);
  EXPECT_FALSE(t.has(Field::Power));
}

// ---- integrity ----

TEST(TableBuilder, DecreasingTimestampsThrow) {
  SampleStream st;
  st.samples.push_back(make_sample(1, {{Field::Speed, 1}}));
  st.samples.push_back(make_sample(0, {{Field::Speed, 1}}));
  EXPECT_THROW(TableBuilder().build(st, all_block0(2)), DataIntegrityError);
}

TEST(TableBuilder, NonFiniteTimestampThrows) {
  SampleStream st;
  st.samples.push_back(make_sample(0, {{Field::Speed, 1}}));
  st.samples.push_back(make_sample(std::nan(""), {{Field::Speed, 1}}));
  EXPECT_THROW(TableBuilder().build(st, all_block0(2)), DataIntegrityError);
}

TEST(TableBuilder, ConflictingDuplicateTimestampsThrow) {
  SampleStream st;
  st.samples.push_back(make_sample(0, {{Field::Speed, 1}}));
  st.samples.push_back(make_sample(0, {{Field::Speed, 2}}));
  EXPECT_THROW(TableBuilder().build(st, all_block0(2)), DataIntegrityError);
}

TEST(TableBuilder, ExactDuplicatesCollapse) {
  SampleStream st;
  st.samples.push_back(make_sample(0, {{Field::Speed, 1}}));
  st.samples.push_back(make_sample(1, {{Field::Speed, 1}}));
  st.samples.push_back(make_sample(1, {{Field::Speed, 1}}));
  st.samples.push_back(make_sample(2, {{Field::Speed, 1}}));
  auto t = TableBuilder().build(st, all_block0(4));
  EXPECT_EQ(t.size(), 3u);
}

TEST(TableBuilder, AssignmentCountMismatchThrows) {
  auto st = speed_stream({1, 1});
  EXPECT_THROW(TableBuilder().build(st, all_block0(1)), std::invalid_argument);
}

// ---- hygiene ----

TEST(TableBuilder, UnitsAreNormalized) {
  SampleStream st;
  st.units[Field::Speed] = "mm/s";
  st.units[Field::Latitude] = "semicircles";
  st.units[Field::Longitude] = "semicircles";
  st.units[Field::Distance] = "km";
  const double semis = std::pow(2.0, 30); // 90 degrees
  st.samples.push_back(make_sample(0, {{Field::Speed, 2500},
                                       {Field::Latitude, semis},
                                       {Field::Longitude, -semis},
                                       {Field::Distance, 1.5}}));
  auto t = TableBuilder().build(st, all_block0(1));
  EXPECT_NEAR(t.column(Field::Speed)->values[0], 2.5, 1e-12);
  EXPECT_NEAR(t.column(Field::Latitude)->values[0], 90.0, 1e-9);
  EXPECT_NEAR(t.column(Field::Longitude)->values[0], -90.0, 1e-9);
  EXPECT_NEAR(t.column(Field::Distance)->values[0], 1500.0, 1e-9);
  EXPECT_EQ(t.column(Field::Speed)->unit, "m/s");
  EXPECT_EQ(t.column(Field::Latitude)->unit, "deg");
}

TEST(TableBuilder, HygieneIsIdempotent) {
  SampleStream st;
  st.units[Field::Speed] = "km/h";
  st.units[Field::Elevation] = "ft";
  st.samples.push_back(make_sample(0, {{Field::Speed, 36}, {Field::Distance, 0}}));
  st.samples.push_back(make_sample(1, {{Field::Speed, 36},
                                       {Field::Elevation, 100},
                                       {Field::Cadence, 80}}));
  st.samples.push_back(make_sample(2, {{Field::Distance, 20},
                                       {Field::Power, 0},
                                       {Field::Elevation, 110}}));
  auto t = TableBuilder().build(st, all_block0(3));
  CanonicalTable again = t;
  TableBuilder::apply_hygiene(again);
  for (const auto &kv : t.columns) {
    const auto &a = kv.second.values;
    const auto &b = again.column(kv.first)->values;
    ASSERT_EQ(a.size(), b.size());
    for (std::size_t i = 0; i < a.size(); ++i) {
      if (std::isnan(a[i]))
        EXPECT_TRUE(std::isnan(b[i]));
      else
        EXPECT_DOUBLE_EQ(a[i], b[i]);
    }
    EXPECT_EQ(kv.second.unit, again.column(kv.first)->unit);
  }
  EXPECT_NEAR(t.column(Field::Speed)->values[0], 10.0, 1e-12);
  EXPECT_NEAR(t.column(Field::Elevation)->values[2], 33.528, 1e-9);
}

TEST(TableBuilder, CadencePowerRepair) {
  SampleStream st;
  st.samples.push_back(make_sample(0, {{Field::Cadence, 80}, {Field::Power, 200}}));
  st.samples.push_back(make_sample(1, {}));                          // both null
  st.samples.push_back(make_sample(2, {{Field::Power, 0}}));         // cad null, power 0
  st.samples.push_back(make_sample(3, {{Field::Cadence, 0}}));       // power null, cad 0
  st.samples.push_back(make_sample(4, {{Field::Power, 150}}));       // cad null, power > 0
  auto t = TableBuilder().build(st, all_block0(5));
  const auto &c = t.column(Field::Cadence)->values;
  const auto &p = t.column(Field::Power)->values;
  EXPECT_DOUBLE_EQ(c[1], 0.0);
  EXPECT_DOUBLE_EQ(p[1], 0.0);
  EXPECT_DOUBLE_EQ(c[2], 0.0);
  EXPECT_DOUBLE_EQ(p[3], 0.0);
  EXPECT_TRUE(std::isnan(c[4]));
  EXPECT_DOUBLE_EQ(p[4], 150.0);
}

TEST(TableBuilder, CadenceWithoutPowerFillsZero) {
  SampleStream st;
  st.samples.push_back(make_sample(0, {{Field::Cadence, 80}}));
  st.samples.push_back(make_sample(1, {{Field::HeartRate, 120}}));
  auto t = TableBuilder().build(st, all_block0(2));
  EXPECT_DOUBLE_EQ(t.column(Field::Cadence)->values[1], 0.0);
}

TEST(TableBuilder, ElevationAndDistanceBackfill) {
  SampleStream st;
  st.samples.push_back(make_sample(0, {{Field::Speed, 1}}));
  st.samples.push_back(make_sample(1, {{Field::Elevation, 12}, {Field::Distance, 1}}));
  st.samples.push_back(make_sample(2, {{Field::Speed, 1}}));
  st.samples.push_back(make_sample(3, {{Field::Speed, 1}, {Field::Elevation, 14},
                                       {Field::Distance, 3}}));
  auto t = TableBuilder().build(st, all_block0(4));
  const auto &e = t.column(Field::Elevation)->values;
  const auto &d = t.column(Field::Distance)->values;
  const auto &v = t.column(Field::Speed)->values;
  EXPECT_DOUBLE_EQ(e[0], 12.0);
  EXPECT_DOUBLE_EQ(e[2], 14.0);
  EXPECT_DOUBLE_EQ(d[0], 1.0);
  EXPECT_DOUBLE_EQ(d[2], 3.0);
  EXPECT_DOUBLE_EQ(v[1], 0.0);
}

TEST(TableBuilder, SpeedAndPositionWithoutDistanceIsNotSupported) {
  SampleStream st;
  st.samples.push_back(make_sample(0, {{Field::Speed, 1},
                                       {Field::Latitude, 45.0},
                                       {Field::Longitude, 7.0}}));
  EXPECT_THROW(TableBuilder().build(st, all_block0(1)), NotSupportedError);
}

TEST(TableBuilder, UnknownUnitIsAmbiguous) {
  SampleStream st;
  st.units[Field::Speed] = "furlongs/fortnight";
  st.samples.push_back(make_sample(0, {{Field::Speed, 1}}));
  EXPECT_THROW(TableBuilder().build(st, all_block0(1)), UnitAmbiguityError);
}
