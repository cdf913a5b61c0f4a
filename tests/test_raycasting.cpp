// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * test_raycasting.cpp
 *
 * Tests for the N-dimensional Bresenham line walk.
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdlib>
#include <vector>

#include "icpmap/mapping/raycasting.hpp"

using namespace icpmap;

namespace {

template <int N>
int maxAbsDelta(const GridIndex<N>& a, const GridIndex<N>& b) {
  return (b - a).cwiseAbs().maxCoeff();
}

/// Consecutive cells differ by at most one step on every axis.
template <int N>
void expectConnected(const std::vector<GridIndex<N>>& cells) {
  for (std::size_t i = 1; i < cells.size(); ++i) {
    EXPECT_LE(maxAbsDelta<N>(cells[i - 1], cells[i]), 1) << "at " << i;
  }
}

}  // namespace

TEST(PlotLineTest, ShallowLine2D) {
  const auto cells = plotLine<double, 2>(Point2d(0, 0), Point2d(10, 3));
  const int expected_xy[][2] = {{0, 0}, {1, 0}, {2, 0}, {3, 1},
                                {4, 1}, {5, 1}, {6, 2}, {7, 2},
                                {8, 2}, {9, 3}, {10, 3}};
  std::vector<GridIndex<2>> expected;
  for (const auto& xy : expected_xy) expected.emplace_back(xy[0], xy[1]);
  ASSERT_EQ(cells.size(), expected.size());
  for (std::size_t i = 0; i < expected.size(); ++i) {
    EXPECT_EQ(cells[i], expected[i]) << "at " << i;
  }
}

TEST(PlotLineTest, SteepLineIncludesBothEndpoints) {
  const auto cells = plotLine<double, 2>(Point2d(0, 0), Point2d(3, 4));
  ASSERT_EQ(cells.size(), 5u);
  EXPECT_EQ(cells.front(), GridIndex<2>(0, 0));
  EXPECT_EQ(cells.back(), GridIndex<2>(3, 4));
  expectConnected<2>(cells);
}

TEST(PlotLineTest, NegativeDirection) {
  const auto cells = plotLine<float, 2>(Point2f(5, 2), Point2f(-3, -1));
  ASSERT_EQ(cells.size(), 9u);
  EXPECT_EQ(cells.front(), GridIndex<2>(5, 2));
  EXPECT_EQ(cells.back(), GridIndex<2>(-3, -1));
  expectConnected<2>(cells);
}

TEST(PlotLineTest, SinglePointLine) {
  const auto cells = plotLine<double, 2>(Point2d(4, 4), Point2d(4, 4));
  ASSERT_EQ(cells.size(), 1u);
  EXPECT_EQ(cells.front(), GridIndex<2>(4, 4));
}

TEST(PlotLineTest, FractionalCoordinatesAreFloored) {
  const auto cells =
      plotLine<double, 2>(Point2d(0.7, 0.2), Point2d(3.9, -0.5));
  ASSERT_EQ(cells.size(), 4u);
  EXPECT_EQ(cells.front(), GridIndex<2>(0, 0));
  EXPECT_EQ(cells.back(), GridIndex<2>(3, -1));
}

TEST(PlotLineTest, ThreeDimensionalLine) {
  const auto cells = plotLine<double, 3>(Point3d(0, 0, 0), Point3d(2, 7, -4));
  ASSERT_EQ(cells.size(), 8u);
  EXPECT_EQ(cells.front(), GridIndex<3>(0, 0, 0));
  EXPECT_EQ(cells.back(), GridIndex<3>(2, 7, -4));
  expectConnected<3>(cells);
}

TEST(PlotLineTest, LengthIsDominantDeltaPlusOne) {
  const std::vector<std::pair<Point2d, Point2d>> cases = {
      {Point2d(0, 0), Point2d(7, 7)},
      {Point2d(-4, 9), Point2d(6, -2)},
      {Point2d(3, 3), Point2d(3, -12)},
      {Point2d(100, 50), Point2d(37, 61)}};
  for (const auto& [start, end] : cases) {
    const auto cells = plotLine<double, 2>(start, end);
    const int dominant =
        static_cast<int>(std::max(std::abs(end.x() - start.x()),
                                  std::abs(end.y() - start.y())));
    EXPECT_EQ(cells.size(), static_cast<std::size_t>(dominant + 1));
    expectConnected<2>(cells);
  }
}
