#include "core/EventMerger.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

using namespace testing_helpers;

TEST(EventMerger, BothEmpty) { EXPECT_TRUE(merge_events({}, {}).empty()); }

TEST(EventMerger, InterleavesByTimestamp) {
  auto out = merge_events({device(0, EventKind::Start), device(10, EventKind::Stop)},
                          {detected(5, EventKind::Stop), detected(7, EventKind::Start)});
  ASSERT_EQ(out.size(), 4u);
  EXPECT_DOUBLE_EQ(out[0].timestamp, 0);
  EXPECT_DOUBLE_EQ(out[1].timestamp, 5);
  EXPECT_DOUBLE_EQ(out[2].timestamp, 7);
  EXPECT_DOUBLE_EQ(out[3].timestamp, 10);
  EXPECT_EQ(out[1].provenance, EventProvenance::Detected);
  EXPECT_EQ(out[3].provenance, EventProvenance::Device);
}

TEST(EventMerger, DeviceWinsOnCollision) {
  auto out = merge_events({device(0, EventKind::Start), device(5, EventKind::Start)},
                          {detected(0, EventKind::Start), detected(5, EventKind::Stop)});
  ASSERT_EQ(out.size(), 2u);
  EXPECT_EQ(out[0].provenance, EventProvenance::Device);
  EXPECT_EQ(out[1].provenance, EventProvenance::Device);
  EXPECT_EQ(out[1].kind, EventKind::Start);
}

TEST(EventMerger, OutputStrictlyIncreasing) {
  std::vector<Event> dev = {device(0, EventKind::Start), device(3, EventKind::Stop),
                            device(3, EventKind::Stop, "stop_all"),
                            device(9, EventKind::Start)};
  std::vector<Event> det = {detected(0, EventKind::Start), detected(2, EventKind::Stop),
                            detected(3, EventKind::Start), detected(9, EventKind::Stop),
                            detected(12, EventKind::Start)};
  auto out = merge_events(dev, det);
  for (std::size_t i = 1; i < out.size(); ++i)
    EXPECT_LT(out[i - 1].timestamp, out[i].timestamp);
  ASSERT_EQ(out.size(), 5u);
  // device events at one instant collapse to the last one
  EXPECT_EQ(out[2].type, "stop_all");
  EXPECT_EQ(out[2].provenance, EventProvenance::Device);
}

TEST(EventMerger, OnlyDetected) {
  auto out = merge_events({}, {detected(1, EventKind::Start), detected(4, EventKind::Stop)});
  ASSERT_EQ(out.size(), 2u);
  EXPECT_EQ(out[0].provenance, EventProvenance::Detected);
}

TEST(EventMerger, OnlyDevice) {
  auto out = merge_events({device(1, EventKind::Start)}, {});
  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(out[0].provenance, EventProvenance::Device);
}
