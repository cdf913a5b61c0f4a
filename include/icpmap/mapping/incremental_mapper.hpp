// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * incremental_mapper.hpp
 *
 * Occupancy mapping from a stream of point clouds, with optional
 * scan-to-scan ICP odometry.
 *
 * The pose is a similarity from the sensor frame into grid cells with
 * scale = resolution (cells per sensor unit), origin at the grid center.
 * Each cloud is ray-cast from the pose origin; traversed cells are freed
 * and the end cell is marked occupied, all tagged with the current 8-bit
 * frame index.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef ICPMAP_MAPPING_INCREMENTAL_MAPPER_HPP
#define ICPMAP_MAPPING_INCREMENTAL_MAPPER_HPP

#include <spdlog/spdlog.h>

#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "icpmap/cloud/point_cloud_ops.hpp"
#include "icpmap/config/mapper.hpp"
#include "icpmap/mapping/occupancy_grid.hpp"
#include "icpmap/mapping/raycasting.hpp"
#include "icpmap/registration/icp.hpp"
#include "icpmap/rigid_transform.hpp"

namespace icpmap {

template <typename T, int N>
class IncrementalMapper {
 public:
  using Grid = OccupancyGrid<T, N>;
  using Cloud = PointCloud<T, N>;
  using Dimensions = typename Grid::Dimensions;
  using Pose = Similarity<T, N>;

  class Builder;
  static Builder builder();

  /**
   * @brief Construct from a validated configuration.
   * @throws std::invalid_argument if dimensions do not have N entries or any
   *         grid or odometry parameter is out of domain
   */
  static IncrementalMapper fromConfig(const config::Mapper& cfg);

  /**
   * @brief Register (optional) and integrate one point cloud.
   *
   * With odometry enabled, a new frame is first aligned against the
   * previous cloud and the resulting delta is composed into the pose. A
   * failed alignment is logged and leaves the pose unchanged.
   *
   * @param cloud Points in the sensor frame [m]
   * @param is_new_frame Advance the frame index (and allow registration)
   * @throws std::invalid_argument if the cloud has non-finite coordinates
   */
  void pushPointCloud(const Cloud& cloud, bool is_new_frame);

  /// Rigid part of the pose (rotation and origin in cell coordinates).
  RigidTransform<T, N> currentPose() const { return pose_.isometry(); }
  const Pose& currentSimilarity() const noexcept { return pose_; }

  const Grid& grid() const noexcept { return grid_; }
  const Cloud& lastCloud() const noexcept { return last_cloud_; }
  std::uint8_t frameIndex() const noexcept { return frame_index_; }
  T resolution() const noexcept { return resolution_; }
  bool odometryEnabled() const noexcept { return odometry_.enabled; }

 private:
  IncrementalMapper(Grid grid, T resolution, const config::Odometry& odometry);

  void updateOdometry(const Cloud& cloud);
  void advanceFrame() noexcept;
  void integrate(const Cloud& cloud);

  Grid grid_;
  T resolution_;
  config::Odometry odometry_;
  ICPConfiguration<T> icp_config_;
  Pose pose_;
  Cloud last_cloud_;
  std::uint8_t frame_index_ = 1;  ///< 1..255, 0 marks never-updated cells
};

/**
 * @brief Optional-field builder with a single validating build().
 *
 * Odometry choice and grid dimensions are required. Everything else
 * defaults to config::Mapper.
 */
template <typename T, int N>
class IncrementalMapper<T, N>::Builder {
 public:
  Builder& withOdometry(bool enabled) {
    odometry_enabled_ = enabled;
    return *this;
  }
  Builder& withOdometry(const config::Odometry& odometry) {
    cfg_.odometry = odometry;
    odometry_enabled_ = odometry.enabled;
    return *this;
  }
  Builder& withDimensions(const Dimensions& dimensions) {
    dimensions_ = dimensions;
    return *this;
  }
  Builder& withResolution(T resolution) {
    cfg_.resolution = static_cast<double>(resolution);
    return *this;
  }
  Builder& withOccupancy(const config::Occupancy& occupancy) {
    cfg_.occupancy = occupancy;
    return *this;
  }

  /// @throws std::invalid_argument if a required field is missing or invalid
  IncrementalMapper build() const {
    if (!odometry_enabled_) {
      throw std::invalid_argument(
          "IncrementalMapper::Builder: odometry must be set");
    }
    if (!dimensions_) {
      throw std::invalid_argument(
          "IncrementalMapper::Builder: dimensions must be set");
    }
    config::Mapper cfg = cfg_;
    cfg.odometry.enabled = *odometry_enabled_;
    cfg.dimensions.assign(dimensions_->begin(), dimensions_->end());
    return IncrementalMapper::fromConfig(cfg);
  }

 private:
  config::Mapper cfg_;
  std::optional<bool> odometry_enabled_;
  std::optional<Dimensions> dimensions_;
};

// ─── IncrementalMapper inline definitions ───────────────────────────────────

template <typename T, int N>
typename IncrementalMapper<T, N>::Builder IncrementalMapper<T, N>::builder() {
  return Builder();
}

template <typename T, int N>
IncrementalMapper<T, N> IncrementalMapper<T, N>::fromConfig(
    const config::Mapper& cfg) {
  if (cfg.dimensions.size() != static_cast<std::size_t>(N)) {
    throw std::invalid_argument(
        "IncrementalMapper: expected " + std::to_string(N) +
        " dimensions, got " + std::to_string(cfg.dimensions.size()));
  }
  if (!(cfg.resolution > 0.0) || !std::isfinite(cfg.resolution)) {
    throw std::invalid_argument(
        "IncrementalMapper: resolution must be finite and > 0");
  }
  if (cfg.odometry.voxel_size < 0.0) {
    throw std::invalid_argument(
        "IncrementalMapper: odometry voxel_size must be >= 0");
  }

  Dimensions dims;
  for (int i = 0; i < N; ++i) dims[i] = cfg.dimensions[i];
  Grid grid(dims, static_cast<T>(cfg.occupancy.occupied_factor),
            static_cast<T>(cfg.occupancy.free_factor),
            static_cast<T>(cfg.occupancy.max_confidence));
  return IncrementalMapper(std::move(grid), static_cast<T>(cfg.resolution),
                           cfg.odometry);
}

template <typename T, int N>
IncrementalMapper<T, N>::IncrementalMapper(Grid grid, T resolution,
                                           const config::Odometry& odometry)
    : grid_(std::move(grid)), resolution_(resolution), odometry_(odometry) {
  config::Registration registration;
  registration.use_spatial_index = odometry_.use_spatial_index;
  registration.max_iterations = odometry_.max_iterations;
  registration.mse_interval_threshold = odometry_.mse_interval_threshold;
  icp_config_ = ICPConfiguration<T>::fromConfig(registration);

  Point<T, N> center;
  for (int i = 0; i < N; ++i) {
    center[i] = static_cast<T>(grid_.dimensions()[i]) / T(2);
  }
  pose_ = Pose(center, RotationTraits<T, N>::identity(), resolution_);
}

template <typename T, int N>
void IncrementalMapper<T, N>::pushPointCloud(const Cloud& cloud,
                                             bool is_new_frame) {
  if (hasNonFinite(cloud)) {
    throw std::invalid_argument(
        "IncrementalMapper: point cloud contains non-finite coordinates");
  }

  Cloud registration_cloud =
      odometry_.voxel_size > 0.0
          ? downsampleVoxel(cloud, static_cast<T>(odometry_.voxel_size))
          : cloud;

  if (odometry_.enabled && is_new_frame && !last_cloud_.empty()) {
    updateOdometry(registration_cloud);
  }
  last_cloud_ = std::move(registration_cloud);

  if (is_new_frame) advanceFrame();
  integrate(cloud);
}

template <typename T, int N>
void IncrementalMapper<T, N>::updateOdometry(const Cloud& cloud) {
  const auto result = icp<T, N>(last_cloud_, cloud, icp_config_);
  if (!result) {
    spdlog::warn(
        "[IncrementalMapper] Registration failed ({}), keeping previous pose",
        toString(result.error()));
    return;
  }

  // The delta is composed as registered, without the grid scale.
  const RigidTransform<T, N>& delta = result.value().transform;
  pose_.appendRotationWrtCenter(delta.rotation());
  pose_.appendTranslation(delta.translation());
  spdlog::debug("[IncrementalMapper] Registered in {} iterations (mse {})",
                result.value().iterations_used, result.value().mse);
}

template <typename T, int N>
void IncrementalMapper<T, N>::advanceFrame() noexcept {
  frame_index_ =
      frame_index_ == 255 ? 1 : static_cast<std::uint8_t>(frame_index_ + 1);
}

template <typename T, int N>
void IncrementalMapper<T, N>::integrate(const Cloud& cloud) {
  constexpr T kCellLimit = static_cast<T>(std::numeric_limits<int>::max() / 2);
  const Point<T, N> origin = pose_.translation();
  if ((origin.array().abs() >= kCellLimit).any()) {
    spdlog::warn("[IncrementalMapper] Pose left the cell range, skipping");
    return;
  }

  std::size_t skipped = 0;
  for (const auto& p : cloud) {
    const Point<T, N> end = pose_.transformPoint(p);
    if ((end.array().abs() >= kCellLimit).any()) {
      ++skipped;
      continue;
    }
    const auto cells = plotLine<T, N>(origin, end);
    for (std::size_t i = 0; i + 1 < cells.size(); ++i) {
      grid_.freeUpdate(cells[i], frame_index_);
    }
    grid_.occupiedUpdate(cells.back(), frame_index_);
  }
  if (skipped > 0) {
    spdlog::warn("[IncrementalMapper] Skipped {} points beyond cell range",
                 skipped);
  }
}

extern template class IncrementalMapper<float, 2>;
extern template class IncrementalMapper<float, 3>;
extern template class IncrementalMapper<double, 2>;
extern template class IncrementalMapper<double, 3>;

}  // namespace icpmap

#endif  // ICPMAP_MAPPING_INCREMENTAL_MAPPER_HPP
