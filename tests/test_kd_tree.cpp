// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * test_kd_tree.cpp
 *
 * Tests for KDTree insertion, nearest-neighbour search and traversal.
 */

#include <gtest/gtest.h>

#include <vector>

#include "icpmap/search/kd_tree.hpp"
#include "icpmap/search/nearest_neighbour.hpp"
#include "test_utils.hpp"

using namespace icpmap;

// ─── Fixture ─────────────────────────────────────────────────────────────────

class KDTreeTest : public ::testing::Test {
 protected:
  void SetUp() override {
    for (const auto& p : points_) tree_.insert(p);
  }

  PointCloud3f points_ = {Point3f(0.0f, 2.0f, 1.0f),
                          Point3f(-1.0f, 4.0f, 2.5f),
                          Point3f(1.3f, 2.5f, 0.5f),
                          Point3f(-2.1f, 0.2f, -0.2f)};
  KDTree<float, 3> tree_;
};

// ─── Insertion ───────────────────────────────────────────────────────────────

TEST_F(KDTreeTest, InsertCountsEveryDistinctPoint) {
  EXPECT_EQ(tree_.size(), 4u);
  EXPECT_FALSE(tree_.empty());
}

TEST_F(KDTreeTest, ExactDuplicateAtBranchPointIsRejected) {
  // (1.3, 2.5, 0.5) sits right of the root and its right slot is empty.
  EXPECT_FALSE(tree_.insert(Point3f(1.3f, 2.5f, 0.5f)));
  EXPECT_EQ(tree_.size(), 4u);
}

TEST(KDTreeInsertTest, CoordinateTieDescendsRight) {
  KDTree<double, 2> tree;
  ASSERT_TRUE(tree.insert(Point2d(1.0, 1.0)));
  // Same x, different y: not a duplicate, stored in the right subtree.
  EXPECT_TRUE(tree.insert(Point2d(1.0, 5.0)));
  EXPECT_TRUE(tree.insert(Point2d(0.0, 0.0)));
  EXPECT_EQ(tree.size(), 3u);

  std::vector<Point2d> order;
  tree.traverse([&](const Point2d& p) { order.push_back(p); });
  ASSERT_EQ(order.size(), 3u);
  EXPECT_EQ(order[0], Point2d(0.0, 0.0));
  EXPECT_EQ(order[1], Point2d(1.0, 1.0));
  EXPECT_EQ(order[2], Point2d(1.0, 5.0));
}

TEST(KDTreeInsertTest, BuildFromCloud) {
  const auto cloud = test::generatePointCloud<double, 2>(50, -10.0, 10.0);
  KDTree<double, 2> tree(cloud);
  EXPECT_EQ(tree.size(), cloud.size());
}

// ─── Nearest neighbour ───────────────────────────────────────────────────────

TEST_F(KDTreeTest, NearestFindsClosestPoint) {
  const auto nearest = tree_.nearest(Point3f(1.32f, 2.7f, 0.2f));
  ASSERT_TRUE(nearest.has_value());
  EXPECT_EQ(*nearest, Point3f(1.3f, 2.5f, 0.5f));
}

TEST_F(KDTreeTest, NearestOfStoredPointIsItself) {
  for (const auto& p : points_) {
    const auto nearest = tree_.nearest(p);
    ASSERT_TRUE(nearest.has_value());
    EXPECT_EQ(*nearest, p);
  }
}

TEST(KDTreeNearestTest, EmptyTreeReturnsNothing) {
  KDTree<float, 2> tree;
  EXPECT_TRUE(tree.empty());
  EXPECT_FALSE(tree.nearest(Point2f(0.0f, 0.0f)).has_value());
}

TEST(KDTreeNearestTest, BacktracksAcrossSplittingPlane) {
  // Root splits on x at 0. The query lies left of the plane but the closest
  // point is on the right, reachable only by backtracking.
  KDTree<double, 2> tree;
  tree.insert(Point2d(0.0, 0.0));
  tree.insert(Point2d(-5.0, 10.0));
  tree.insert(Point2d(0.5, 3.0));

  const auto nearest = tree.nearest(Point2d(-0.1, 3.0));
  ASSERT_TRUE(nearest.has_value());
  EXPECT_EQ(*nearest, Point2d(0.5, 3.0));
}

template <int N>
void expectParityWithLinearScan(std::uint32_t seed) {
  const auto cloud = test::generatePointCloud<double, N>(200, -20.0, 20.0, seed);
  const auto queries =
      test::generatePointCloud<double, N>(50, -25.0, 25.0, seed + 1000);
  KDTree<double, N> tree(cloud);

  for (const auto& q : queries) {
    const auto fast = tree.nearest(q);
    const auto slow = findNearestNeighbourNaive<double, N>(q, cloud);
    ASSERT_TRUE(fast.has_value());
    ASSERT_TRUE(slow.has_value());
    // Distances are compared so exact ties cannot cause spurious failures.
    EXPECT_EQ((*fast - q).squaredNorm(), (*slow - q).squaredNorm())
        << "seed " << seed;
  }
}

TEST(KDTreeNearestTest, MatchesLinearScan2D) {
  for (std::uint32_t seed = 0; seed < 100; ++seed) {
    expectParityWithLinearScan<2>(seed);
  }
}

TEST(KDTreeNearestTest, MatchesLinearScan3D) {
  for (std::uint32_t seed = 0; seed < 100; ++seed) {
    expectParityWithLinearScan<3>(seed);
  }
}

// ─── Traversal ───────────────────────────────────────────────────────────────

TEST_F(KDTreeTest, TraverseVisitsEveryPoint) {
  float sum = 0.0f;
  std::size_t visited = 0;
  tree_.traverse([&](const Point3f& p) {
    sum += p.x() + p.y();
    ++visited;
  });
  EXPECT_EQ(visited, 4u);
  EXPECT_NEAR(sum, 6.9f, 1e-5f);
}

TEST_F(KDTreeTest, TraverseIsInOrderOnRootAxis) {
  // Left subtree of the root holds strictly smaller x.
  std::vector<Point3f> order;
  tree_.traverse([&](const Point3f& p) { order.push_back(p); });
  ASSERT_EQ(order.size(), 4u);
  EXPECT_EQ(order.back(), Point3f(1.3f, 2.5f, 0.5f));
}

TEST_F(KDTreeTest, TraverseMutEditsInPlace) {
  tree_.traverseMut([](Point3f& p) { p.z() += 10.0f; });

  float z_sum = 0.0f;
  tree_.traverse([&](const Point3f& p) { z_sum += p.z(); });
  EXPECT_NEAR(z_sum, 1.0f + 2.5f + 0.5f - 0.2f + 40.0f, 1e-4f);
}
