// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * test_icp.cpp
 *
 * Tests for ICP registration: preconditions, convergence and failure.
 */

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include "icpmap/cloud/point_cloud_ops.hpp"
#include "icpmap/registration/icp.hpp"
#include "icpmap/search/nearest_neighbour.hpp"
#include "test_utils.hpp"

using namespace icpmap;

// ─── Fixture ─────────────────────────────────────────────────────────────────

class ICP2DTest : public ::testing::Test {
 protected:
  void SetUp() override {
    source_ = test::generatePointCloud<double, 2>(100, -15.0, 15.0);
    truth_ = test::makeTransform2D(-0.8, 1.3, 0.1);
    target_ = transformCloud(source_, truth_);
  }

  ICPConfiguration<double> config(bool spatial_index,
                                  std::size_t iterations) const {
    return ICPConfiguration<double>::builder()
        .withSpatialIndex(spatial_index)
        .withMaxIterations(iterations)
        .withMSEIntervalThreshold(0.01)
        .build();
  }

  PointCloud2d source_;
  PointCloud2d target_;
  RigidTransform2d truth_;
};

// ─── Preconditions ───────────────────────────────────────────────────────────

TEST_F(ICP2DTest, EmptySourceFails) {
  const auto result = icp(PointCloud2d{}, target_, config(true, 50));
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error(), ICPError::SourceCloudEmpty);
  EXPECT_FALSE(result.failure().centroids.has_value());
}

TEST_F(ICP2DTest, EmptyTargetFails) {
  const auto result = icp(source_, PointCloud2d{}, config(false, 50));
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error(), ICPError::TargetCloudEmpty);
}

TEST_F(ICP2DTest, EmptySourceIsReportedBeforeEmptyTarget) {
  const auto result = icp(PointCloud2d{}, PointCloud2d{}, config(false, 50));
  EXPECT_EQ(result.error(), ICPError::SourceCloudEmpty);
}

TEST_F(ICP2DTest, InvalidConfigurationFails) {
  ICPConfiguration<double> cfg;
  cfg.max_iterations = 0;
  EXPECT_EQ(icp(source_, target_, cfg).error(),
            ICPError::IterationBudgetIsZero);

  cfg.max_iterations = 10;
  cfg.mse_interval_threshold = std::numeric_limits<double>::epsilon();
  EXPECT_EQ(icp(source_, target_, cfg).error(),
            ICPError::IntervalThresholdTooLow);

  cfg.mse_interval_threshold = 0.01;
  cfg.mse_absolute_threshold = std::numeric_limits<double>::quiet_NaN();
  EXPECT_EQ(icp(source_, target_, cfg).error(),
            ICPError::AbsoluteThresholdTooLow);

  cfg.mse_absolute_threshold = 0.0;
  EXPECT_EQ(icp(source_, target_, cfg).error(),
            ICPError::AbsoluteThresholdTooLow);
}

// ─── Configuration ───────────────────────────────────────────────────────────

TEST(ICPConfigurationTest, BuilderDefaults) {
  const auto cfg = ICPConfiguration<float>::builder().build();
  EXPECT_FALSE(cfg.use_spatial_index);
  EXPECT_EQ(cfg.max_iterations, 20u);
  EXPECT_FALSE(cfg.mse_absolute_threshold.has_value());
  EXPECT_FLOAT_EQ(cfg.mse_interval_threshold, 0.01f);
}

TEST(ICPConfigurationTest, BuilderRejectsInvalidValues) {
  EXPECT_THROW(ICPConfiguration<float>::builder().withMaxIterations(0).build(),
               std::invalid_argument);
  EXPECT_THROW(
      ICPConfiguration<float>::builder().withMSEIntervalThreshold(0.0f).build(),
      std::invalid_argument);
  EXPECT_THROW(ICPConfiguration<double>::builder()
                   .withAbsoluteMSEThreshold(-1.0)
                   .build(),
               std::invalid_argument);
}

TEST(ICPConfigurationTest, ErrorNamesAreStable) {
  EXPECT_STREQ(toString(ICPError::SourceCloudEmpty), "SourceCloudEmpty");
  EXPECT_STREQ(toString(ICPError::DidNotConverge), "DidNotConverge");
  EXPECT_STREQ(toString(ICPError::NoNearestNeighbourFound),
               "NoNearestNeighbourFound");
}

// ─── Convergence ─────────────────────────────────────────────────────────────

TEST_F(ICP2DTest, ConvergesWithSpatialIndex) {
  const auto result = icp(source_, target_, config(true, 50));
  ASSERT_TRUE(result.ok()) << toString(result.error());

  const auto& success = result.value();
  EXPECT_LT(success.mse, 0.01);
  EXPECT_NEAR(success.transform.translation().x(), -0.8, 0.05);
  EXPECT_NEAR(success.transform.translation().y(), 1.3, 0.05);
  EXPECT_NEAR(success.transform.rotation().smallestAngle(), 0.1, 0.01);

  // The inverse undoes the offset.
  const auto inverse = success.transform.inverse();
  EXPECT_NEAR((inverse.translation() - truth_.inverse().translation()).norm(),
              0.0, 0.05);
}

TEST_F(ICP2DTest, ConvergesWithLinearScan) {
  const auto result = icp(source_, target_, config(false, 10));
  ASSERT_TRUE(result.ok()) << toString(result.error());
  EXPECT_LT(result.value().mse, 0.01);
  EXPECT_LT(result.value().iterations_used, 10u);
}

TEST_F(ICP2DTest, AbsoluteThresholdStopsEarly) {
  const auto cfg = ICPConfiguration<double>::builder()
                       .withSpatialIndex(true)
                       .withMaxIterations(50)
                       .withAbsoluteMSEThreshold(0.1)
                       .build();
  const auto result = icp(source_, target_, cfg);
  ASSERT_TRUE(result.ok()) << toString(result.error());
  EXPECT_LT(result.value().mse, 0.1);
}

TEST_F(ICP2DTest, ReportedMSEMatchesRecomputedMSE) {
  const auto result = icp(source_, target_, config(true, 50));
  ASSERT_TRUE(result.ok());

  const auto aligned = transformCloud(source_, result.value().transform);
  double sum = 0.0;
  for (const auto& p : aligned) {
    const auto nearest = findNearestNeighbourNaive<double, 2>(p, target_);
    ASSERT_TRUE(nearest.has_value());
    sum += (p - *nearest).squaredNorm();
  }
  EXPECT_NEAR(sum / aligned.size(), result.value().mse, 1e-9);
}

TEST_F(ICP2DTest, RerunFromConvergedPoseIsStable) {
  const auto first = icp(source_, target_, config(true, 50));
  ASSERT_TRUE(first.ok());

  const auto aligned = transformCloud(source_, first.value().transform);
  const auto second = icp(aligned, target_, config(true, 50));
  ASSERT_TRUE(second.ok());
  EXPECT_LE(second.value().iterations_used, 1u);
  EXPECT_NEAR(second.value().mse, first.value().mse, 1e-6);
}

TEST(ICPTest, ConvergesInFloat2D) {
  const auto source = test::generatePointCloud<float, 2>(100, -15.0f, 15.0f);
  const auto target =
      transformCloud(source, test::makeTransform2D(-0.8f, 1.3f, 0.1f));
  const auto cfg = ICPConfiguration<float>::builder()
                       .withSpatialIndex(true)
                       .withMaxIterations(50)
                       .build();

  const auto result = icp(source, target, cfg);
  ASSERT_TRUE(result.ok()) << toString(result.error());
  EXPECT_LT(result.value().mse, 0.01f);
}

TEST(ICPTest, Converges3D) {
  const auto source = test::generatePointCloud<double, 3>(500, -15.0, 15.0);
  const auto truth =
      test::makeTransform3D(Point3d(-0.8, 1.3, 0.2), 0.1, 0.2, -0.21);
  const auto target = transformCloud(source, truth);
  const auto cfg = ICPConfiguration<double>::builder()
                       .withSpatialIndex(true)
                       .withMaxIterations(50)
                       .build();

  const auto result = icp(source, target, cfg);
  ASSERT_TRUE(result.ok()) << toString(result.error());
  EXPECT_LT(result.value().mse, 0.05);
  EXPECT_NEAR(result.value().transform.rotationMatrix().determinant(), 1.0,
              1e-9);
  EXPECT_TRUE(result.value().transform.translation().isApprox(
      truth.translation(), 1e-3));
}

// ─── Failure ─────────────────────────────────────────────────────────────────

TEST(ICPTest, ExhaustedBudgetReportsNonConvergence) {
  const auto source = test::generatePointCloud<double, 2>(200, -15.0, 15.0);
  const auto target = transformCloud(
      source, test::makeTransform2D(-12.5, 7.3, 3.14159265358979 / 2));
  const auto cfg = ICPConfiguration<double>::builder()
                       .withMaxIterations(1)
                       .withMSEIntervalThreshold(0.001)
                       .build();

  const auto result = icp(source, target, cfg);
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(result.error(), ICPError::DidNotConverge);
  ASSERT_TRUE(result.failure().centroids.has_value());
  EXPECT_TRUE(result.failure().centroids->first.isApprox(
      calculateCentroid(source)));
}

// ─── Single iteration ────────────────────────────────────────────────────────

TEST_F(ICP2DTest, FirstIterationNeverConvergesOnInterval) {
  PointCloud2d transformed = source_;
  RigidTransform2d transform;
  const auto report = icpIteration<double, 2>(
      source_, target_, nullptr, config(false, 50), transformed, transform,
      std::numeric_limits<double>::max());

  EXPECT_FALSE(report.error.has_value());
  EXPECT_FALSE(report.converged);
  EXPECT_TRUE(std::isfinite(report.mse));
  for (std::size_t i = 0; i < source_.size(); ++i) {
    EXPECT_TRUE(transformed[i].isApprox(transform.transformPoint(source_[i])));
  }
}
