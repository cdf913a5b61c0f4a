// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * icp.hpp
 *
 * Point-to-point Iterative Closest Point registration.
 *
 * Each iteration matches every transformed source point to its nearest
 * target point, re-estimates the rigid transform in closed form and checks
 * the mean squared error of the matches against the convergence thresholds.
 *
 *  Created on: Feb 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef ICPMAP_REGISTRATION_ICP_HPP
#define ICPMAP_REGISTRATION_ICP_HPP

#include <spdlog/spdlog.h>

#include <cmath>
#include <limits>
#include <optional>

#include "icpmap/cloud/point_cloud_ops.hpp"
#include "icpmap/registration/icp_types.hpp"
#include "icpmap/registration/rigid_alignment.hpp"
#include "icpmap/search/kd_tree.hpp"
#include "icpmap/search/nearest_neighbour.hpp"

namespace icpmap {

/// Outcome of a single ICP iteration.
template <typename T, int N>
struct ICPIterationReport {
  std::optional<ICPError> error;  ///< Set when a match could not be found
  bool converged = false;
  T mse = std::numeric_limits<T>::max();
  Point<T, N> source_centroid = Point<T, N>::Zero();
  Point<T, N> target_centroid = Point<T, N>::Zero();
};

/**
 * @brief Run one ICP iteration in place.
 *
 * Matches `transformed` against `target` (through `tree` when non-null),
 * updates `transform`, rewrites `transformed` as `transform` applied to
 * `source`, and tests convergence against `previous_mse`.
 *
 * @param source Original, untransformed source cloud
 * @param target Target cloud
 * @param tree Optional spatial index over `target`
 * @param config Thresholds for the convergence test
 * @param transformed Source under the current transform (updated)
 * @param transform Accumulated source-to-target transform (updated)
 * @param previous_mse MSE of the previous iteration
 */
template <typename T, int N>
ICPIterationReport<T, N> icpIteration(const PointCloud<T, N>& source,
                                      const PointCloud<T, N>& target,
                                      const KDTree<T, N>* tree,
                                      const ICPConfiguration<T>& config,
                                      PointCloud<T, N>& transformed,
                                      RigidTransform<T, N>& transform,
                                      T previous_mse);

/**
 * @brief Estimate the rigid transform aligning `source` onto `target`.
 *
 * Preconditions are checked before any iteration, in order: empty source,
 * empty target, then ICPConfiguration::validate().
 *
 * @throws std::runtime_error only on SVD failure
 */
template <typename T, int N>
ICPResult<T, N> icp(const PointCloud<T, N>& source,
                    const PointCloud<T, N>& target,
                    const ICPConfiguration<T>& config);

// ─── ICP inline definitions ─────────────────────────────────────────────────

template <typename T, int N>
ICPIterationReport<T, N> icpIteration(const PointCloud<T, N>& source,
                                      const PointCloud<T, N>& target,
                                      const KDTree<T, N>* tree,
                                      const ICPConfiguration<T>& config,
                                      PointCloud<T, N>& transformed,
                                      RigidTransform<T, N>& transform,
                                      T previous_mse) {
  ICPIterationReport<T, N> report;

  PointCloud<T, N> matched;
  matched.reserve(transformed.size());
  for (const auto& p : transformed) {
    auto nearest =
        tree ? tree->nearest(p) : findNearestNeighbourNaive<T, N>(p, target);
    if (!nearest) {
      report.error = ICPError::NoNearestNeighbourFound;
      return report;
    }
    matched.push_back(*nearest);
  }

  const CrossCovariance<T, N> covariance = crossCovariance(transformed, matched);
  report.source_centroid = covariance.source_centroid;
  report.target_centroid = covariance.target_centroid;

  transform = updateTransform(transform, covariance);
  for (std::size_t i = 0; i < source.size(); ++i) {
    transformed[i] = transform.transformPoint(source[i]);
  }

  T sum = T(0);
  for (std::size_t i = 0; i < transformed.size(); ++i) {
    sum += (transformed[i] - matched[i]).squaredNorm();
  }
  report.mse = sum / static_cast<T>(transformed.size());

  report.converged = (config.mse_absolute_threshold &&
                      report.mse < *config.mse_absolute_threshold) ||
                     std::abs(previous_mse - report.mse) <
                         config.mse_interval_threshold;
  return report;
}

template <typename T, int N>
ICPResult<T, N> icp(const PointCloud<T, N>& source,
                    const PointCloud<T, N>& target,
                    const ICPConfiguration<T>& config) {
  if (source.empty()) return ICPError::SourceCloudEmpty;
  if (target.empty()) return ICPError::TargetCloudEmpty;
  if (auto error = config.validate()) return *error;

  std::optional<KDTree<T, N>> tree;
  if (config.use_spatial_index) tree.emplace(target);

  RigidTransform<T, N> transform;
  PointCloud<T, N> transformed = source;
  T previous_mse = std::numeric_limits<T>::max();
  ICPFailure<T, N> failure;

  for (std::size_t iteration = 0; iteration < config.max_iterations;
       ++iteration) {
    const auto report =
        icpIteration<T, N>(source, target, tree ? &*tree : nullptr, config,
                           transformed, transform, previous_mse);
    if (report.error) return *report.error;

    spdlog::trace("[ICP] iteration {} mse {}", iteration, report.mse);
    if (report.converged) {
      return ICPSuccess<T, N>{transform, report.mse, iteration};
    }
    previous_mse = report.mse;
    failure.centroids.emplace(report.source_centroid, report.target_centroid);
  }

  spdlog::debug("[ICP] no convergence after {} iterations (last mse {})",
                config.max_iterations, previous_mse);
  return failure;
}

extern template ICPResult<float, 2> icp<float, 2>(
    const PointCloud<float, 2>&, const PointCloud<float, 2>&,
    const ICPConfiguration<float>&);
extern template ICPResult<float, 3> icp<float, 3>(
    const PointCloud<float, 3>&, const PointCloud<float, 3>&,
    const ICPConfiguration<float>&);
extern template ICPResult<double, 2> icp<double, 2>(
    const PointCloud<double, 2>&, const PointCloud<double, 2>&,
    const ICPConfiguration<double>&);
extern template ICPResult<double, 3> icp<double, 3>(
    const PointCloud<double, 3>&, const PointCloud<double, 3>&,
    const ICPConfiguration<double>&);

}  // namespace icpmap

#endif  // ICPMAP_REGISTRATION_ICP_HPP
