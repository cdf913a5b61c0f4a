// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * rigid_alignment.hpp
 *
 * Closed-form best-fit rotation and translation between matched point sets
 * (SVD of the cross-covariance, with reflection correction).
 */

#ifndef ICPMAP_REGISTRATION_RIGID_ALIGNMENT_HPP
#define ICPMAP_REGISTRATION_RIGID_ALIGNMENT_HPP

#include <Eigen/Core>
#include <Eigen/SVD>
#include <stdexcept>

#include "icpmap/cloud/point_cloud_ops.hpp"
#include "icpmap/point_types.hpp"
#include "icpmap/rigid_transform.hpp"

static_assert(EIGEN_VERSION_AT_LEAST(3, 4, 0),
              "icpmap requires Eigen >= 3.4 (JacobiSVD::info)");

namespace icpmap {

/// Cross-covariance of matched sets plus the centroids it was taken about.
template <typename T, int N>
struct CrossCovariance {
  Eigen::Matrix<T, N, N> matrix = Eigen::Matrix<T, N, N>::Zero();
  Point<T, N> source_centroid = Point<T, N>::Zero();
  Point<T, N> target_centroid = Point<T, N>::Zero();
};

/**
 * @brief Cross-covariance of `source[i]` matched to `target[i]`.
 *
 * Rows index the target axes and columns the source axes:
 * M = sum (b_i - mean_b)(a_i - mean_a)^T. With M = U S V^T, U V^T then
 * rotates source onto target.
 *
 * @throws std::invalid_argument if the sets differ in size
 */
template <typename T, int N>
CrossCovariance<T, N> crossCovariance(const PointCloud<T, N>& source,
                                      const PointCloud<T, N>& target) {
  if (source.size() != target.size()) {
    throw std::invalid_argument(
        "crossCovariance: matched sets must have equal size");
  }
  CrossCovariance<T, N> result;
  result.source_centroid = calculateCentroid(source);
  result.target_centroid = calculateCentroid(target);
  for (std::size_t i = 0; i < source.size(); ++i) {
    result.matrix.noalias() += (target[i] - result.target_centroid) *
                               (source[i] - result.source_centroid).transpose();
  }
  return result;
}

/**
 * @brief Best-fit proper rotation for a cross-covariance matrix.
 *
 * R = U V^T; if det(R) < 0 the last column of U is negated so R is a
 * rotation and not a reflection.
 *
 * @throws std::runtime_error if the decomposition fails or is non-finite
 */
template <typename T, int N>
Eigen::Matrix<T, N, N> estimateRotation(const Eigen::Matrix<T, N, N>& m) {
  using Matrix = Eigen::Matrix<T, N, N>;
  if (!m.allFinite()) {
    throw std::runtime_error("estimateRotation: non-finite covariance");
  }
  Eigen::JacobiSVD<Matrix> svd(m, Eigen::ComputeFullU | Eigen::ComputeFullV);
  if (svd.info() != Eigen::Success) {
    throw std::runtime_error("estimateRotation: SVD did not converge");
  }
  Matrix u = svd.matrixU();
  const Matrix& v = svd.matrixV();
  Matrix rotation = u * v.transpose();
  if (rotation.determinant() < T(0)) {
    u.col(N - 1) *= T(-1);
    rotation = u * v.transpose();
  }
  return rotation;
}

/**
 * @brief Fold one alignment step into an accumulated transform.
 *
 * The step is (R, t) with t = mean_target - R * mean_source; the result is
 * step * previous, i.e. the step is applied after `previous`.
 */
template <typename T, int N>
RigidTransform<T, N> updateTransform(const RigidTransform<T, N>& previous,
                                     const CrossCovariance<T, N>& covariance) {
  const Eigen::Matrix<T, N, N> rotation =
      estimateRotation<T, N>(covariance.matrix);
  const Point<T, N> translation =
      covariance.target_centroid - rotation * covariance.source_centroid;
  return RigidTransform<T, N>::fromParts(rotation, translation) * previous;
}

}  // namespace icpmap

#endif  // ICPMAP_REGISTRATION_RIGID_ALIGNMENT_HPP
