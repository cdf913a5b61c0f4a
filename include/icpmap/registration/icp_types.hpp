// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * icp_types.hpp
 *
 * Configuration, outcome and error types of ICP registration.
 *
 *  Created on: Feb 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef ICPMAP_REGISTRATION_ICP_TYPES_HPP
#define ICPMAP_REGISTRATION_ICP_TYPES_HPP

#include <cmath>
#include <cstddef>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

#include "icpmap/config/registration.hpp"
#include "icpmap/point_types.hpp"
#include "icpmap/rigid_transform.hpp"

namespace icpmap {

enum class ICPError {
  SourceCloudEmpty,
  TargetCloudEmpty,
  IterationBudgetIsZero,
  IntervalThresholdTooLow,
  AbsoluteThresholdTooLow,
  NoNearestNeighbourFound,
  DidNotConverge,
};

/// Stable name of an error variant, e.g. "DidNotConverge".
const char* toString(ICPError error) noexcept;

// ─── Configuration ──────────────────────────────────────────────────────────

template <typename T>
struct ICPConfiguration {
  bool use_spatial_index = false;
  std::size_t max_iterations = 20;
  std::optional<T> mse_absolute_threshold;
  T mse_interval_threshold = T(0.01);

  /// First violated precondition, checked in declaration order.
  std::optional<ICPError> validate() const;

  class Builder;
  static Builder builder();

  /// @throws std::invalid_argument if the converted values are invalid
  static ICPConfiguration fromConfig(const config::Registration& cfg);
};

/// Fluent construction with a single validating build().
template <typename T>
class ICPConfiguration<T>::Builder {
 public:
  Builder& withSpatialIndex(bool enabled) {
    config_.use_spatial_index = enabled;
    return *this;
  }
  Builder& withMaxIterations(std::size_t iterations) {
    config_.max_iterations = iterations;
    return *this;
  }
  Builder& withAbsoluteMSEThreshold(std::optional<T> threshold) {
    config_.mse_absolute_threshold = threshold;
    return *this;
  }
  Builder& withMSEIntervalThreshold(T threshold) {
    config_.mse_interval_threshold = threshold;
    return *this;
  }

  /// @throws std::invalid_argument naming the violated precondition
  ICPConfiguration build() const {
    if (auto error = config_.validate()) {
      throw std::invalid_argument(
          std::string("Invalid ICP configuration: ") + toString(*error));
    }
    return config_;
  }

 private:
  ICPConfiguration config_;
};

// ─── Outcome ────────────────────────────────────────────────────────────────

template <typename T, int N>
struct ICPSuccess {
  RigidTransform<T, N> transform;  ///< Maps source onto target
  T mse = T(0);
  /// Zero-based index of the iteration that converged.
  std::size_t iterations_used = 0;
};

template <typename T, int N>
struct ICPFailure {
  ICPError error = ICPError::DidNotConverge;
  /// Source and target centroids of the last failed iteration, when known.
  std::optional<std::pair<Point<T, N>, Point<T, N>>> centroids;
};

/// Either an ICPSuccess or an ICPFailure.
template <typename T, int N>
class ICPResult {
 public:
  ICPResult(ICPSuccess<T, N> success) : outcome_(std::move(success)) {}
  ICPResult(ICPFailure<T, N> failure) : outcome_(std::move(failure)) {}
  ICPResult(ICPError error) : outcome_(ICPFailure<T, N>{error, {}}) {}

  bool ok() const noexcept {
    return std::holds_alternative<ICPSuccess<T, N>>(outcome_);
  }
  explicit operator bool() const noexcept { return ok(); }

  /// @throws std::bad_variant_access on failure
  const ICPSuccess<T, N>& value() const {
    return std::get<ICPSuccess<T, N>>(outcome_);
  }
  /// @throws std::bad_variant_access on success
  const ICPFailure<T, N>& failure() const {
    return std::get<ICPFailure<T, N>>(outcome_);
  }
  ICPError error() const { return failure().error; }

 private:
  std::variant<ICPSuccess<T, N>, ICPFailure<T, N>> outcome_;
};

// ─── ICPConfiguration inline definitions ────────────────────────────────────

template <typename T>
std::optional<ICPError> ICPConfiguration<T>::validate() const {
  constexpr T kEpsilon = std::numeric_limits<T>::epsilon();
  if (max_iterations == 0) return ICPError::IterationBudgetIsZero;
  if (!(mse_interval_threshold > kEpsilon)) {
    return ICPError::IntervalThresholdTooLow;
  }
  if (mse_absolute_threshold &&
      (std::isnan(*mse_absolute_threshold) ||
       *mse_absolute_threshold <= kEpsilon)) {
    return ICPError::AbsoluteThresholdTooLow;
  }
  return std::nullopt;
}

template <typename T>
typename ICPConfiguration<T>::Builder ICPConfiguration<T>::builder() {
  return Builder();
}

template <typename T>
ICPConfiguration<T> ICPConfiguration<T>::fromConfig(
    const config::Registration& cfg) {
  if (cfg.max_iterations <= 0) {
    throw std::invalid_argument(
        std::string("Invalid ICP configuration: ") +
        toString(ICPError::IterationBudgetIsZero));
  }
  std::optional<T> absolute;
  if (cfg.mse_absolute_threshold) {
    absolute = static_cast<T>(*cfg.mse_absolute_threshold);
  }
  return builder()
      .withSpatialIndex(cfg.use_spatial_index)
      .withMaxIterations(static_cast<std::size_t>(cfg.max_iterations))
      .withAbsoluteMSEThreshold(absolute)
      .withMSEIntervalThreshold(static_cast<T>(cfg.mse_interval_threshold))
      .build();
}

}  // namespace icpmap

#endif  // ICPMAP_REGISTRATION_ICP_TYPES_HPP
