#include "core/SpatialUtils.hpp"
#include "core/filters/SavitzkyGolay.hpp"
#include <cmath>
#include <gtest/gtest.h>

TEST(SpatialUtils, GradeRawShortPath) {
  const std::vector<double> d = {0, 100, 200, 300};
  const std::vector<double> e = {0, 50, 75, 75};
  auto g = SpatialUtils::grade_raw(d, e);
  ASSERT_EQ(g.size(), 4u);
  EXPECT_TRUE(std::isnan(g[0]));
  EXPECT_NEAR(g[1], 0.5, 1e-12);
  EXPECT_NEAR(g[2], 0.25, 1e-12);
  EXPECT_NEAR(g[3], 0.0, 1e-12);
}

TEST(SpatialUtils, GradeSmoothStaysCloseOnShortSeries) {
  const std::vector<double> d = {0, 100, 200, 300};
  const std::vector<double> e = {0, 50, 75, 75};
  auto raw = SpatialUtils::grade_raw(d, e);
  auto smooth = SpatialUtils::grade_smooth(d, e);
  ASSERT_EQ(smooth.size(), raw.size());
  EXPECT_TRUE(std::isnan(smooth[0]));
  for (std::size_t i = 1; i < raw.size(); ++i)
    EXPECT_NEAR(smooth[i], raw[i], 0.1) << "point " << i;
}

TEST(SpatialUtils, GradeRoundTripsThroughCumulativeSum) {
  const std::vector<double> d = {0, 10, 25, 40, 60, 80};
  const std::vector<double> e = {100, 101, 99.5, 102, 103, 101};
  auto g = SpatialUtils::grade_raw(d, e);
  double y = e.front();
  for (std::size_t i = 1; i < d.size(); ++i) {
    y += g[i] * (d[i] - d[i - 1]);
    EXPECT_NEAR(y, e[i], 1e-9);
  }
}

TEST(SpatialUtils, ElevationSmoothRemovesSpike) {
  std::vector<double> d, e;
  for (int i = 0; i <= 600; i += 10) {
    d.push_back(i);
    e.push_back(100.0 + 0.02 * i);
  }
  e[30] += 40.0; // GPS spike
  auto s = SpatialUtils::elevation_smooth(d, e);
  ASSERT_EQ(s.size(), e.size());
  EXPECT_NEAR(s[30], 100.0 + 0.02 * d[30], 2.0);
  EXPECT_NEAR(s.front(), 100.0, 2.0);
}

TEST(SpatialUtils, ElevationSmoothDegenerateDistance) {
  const std::vector<double> d = {0, 0, 0};
  const std::vector<double> e = {5, 6, 7};
  EXPECT_EQ(SpatialUtils::elevation_smooth(d, e), e);
}

TEST(SpatialUtils, Haversine) {
  // one degree of latitude
  EXPECT_NEAR(SpatialUtils::haversine(Coordinate{0, 0}, Coordinate{1, 0}),
              111195.0, 10.0);
  EXPECT_DOUBLE_EQ(
      SpatialUtils::haversine(Coordinate{45, 7}, Coordinate{45, 7}), 0.0);
}

TEST(SpatialUtils, DistanceFromPositionIsCumulative) {
  const std::vector<double> lat = {0, 0.001, std::nan(""), 0.003};
  const std::vector<double> lon = {0, 0, 0, 0};
  auto d = SpatialUtils::distance_from_position(lat, lon);
  ASSERT_EQ(d.size(), 4u);
  EXPECT_DOUBLE_EQ(d[0], 0.0);
  for (std::size_t i = 1; i < d.size(); ++i)
    EXPECT_GE(d[i], d[i - 1]);
  EXPECT_NEAR(d.back(), 333.6, 1.0);
}

TEST(SpatialUtils, ElevationGainHysteresis) {
  // small wiggles under 5 m never count
  EXPECT_DOUBLE_EQ(SpatialUtils::elevation_gain({100, 103, 100, 104, 101}),
                   0.0);
  // a dip resets the reference point
  EXPECT_DOUBLE_EQ(SpatialUtils::elevation_gain({100, 106, 104, 112}), 14.0);
  EXPECT_DOUBLE_EQ(SpatialUtils::elevation_gain({100, 104, 108}), 8.0);
  EXPECT_DOUBLE_EQ(SpatialUtils::elevation_loss({112, 104, 106, 100}), 14.0);
}

TEST(SpatialUtils, InterpolateNan) {
  std::vector<double> y = {std::nan(""), 1, std::nan(""), 3, std::nan("")};
  SpatialUtils::interpolate_nan(y);
  const std::vector<double> expected = {1, 1, 2, 3, 3};
  EXPECT_EQ(y, expected);
}

TEST(SpatialUtils, InterpExtrapolate) {
  auto out = SpatialUtils::interp_extrapolate({0, 10}, {0, 1}, {-10, 5, 20});
  EXPECT_NEAR(out[0], -1.0, 1e-12);
  EXPECT_NEAR(out[1], 0.5, 1e-12);
  EXPECT_NEAR(out[2], 2.0, 1e-12);
}

TEST(SpatialUtils, Median) {
  EXPECT_DOUBLE_EQ(SpatialUtils::median({3, 1, 2}), 2.0);
  EXPECT_DOUBLE_EQ(SpatialUtils::median({4, 1, 3, 2}), 2.5);
  EXPECT_TRUE(std::isnan(SpatialUtils::median({})));
}

// ---- Savitzky-Golay ----

TEST(SavitzkyGolay, PreservesPolynomialsUpToOrder) {
  filters::SavitzkyGolay sg(5, 2);
  std::vector<double> y;
  for (int i = 0; i < 12; ++i)
    y.push_back(0.5 * i * i - 3.0 * i + 2.0);
  auto out = sg.apply(y);
  ASSERT_EQ(out.size(), y.size());
  for (std::size_t i = 0; i < y.size(); ++i)
    EXPECT_NEAR(out[i], y[i], 1e-8);
}

TEST(SavitzkyGolay, ShortSeriesUnchanged) {
  filters::SavitzkyGolay sg(5, 2);
  const std::vector<double> y = {1, 5, 2};
  EXPECT_EQ(sg.apply(y), y);
}

TEST(SavitzkyGolay, BadParametersThrow) {
  EXPECT_THROW(filters::SavitzkyGolay(4, 2), std::invalid_argument);
  EXPECT_THROW(filters::SavitzkyGolay(3, 3), std::invalid_argument);
}
