// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * mapper.hpp
 *
 * Incremental mapper configuration (grid geometry, occupancy update
 * factors and scan-to-scan odometry).
 */

#ifndef ICPMAP_CONFIG_MAPPER_HPP
#define ICPMAP_CONFIG_MAPPER_HPP

#include <cstddef>
#include <vector>

namespace icpmap::config {

/**
 * @brief Log-odds update parameters.
 *
 * Factors must be > 1. A hit adds ln(f_occ - 1/f_occ) and a pass-through
 * subtracts ln(f_free - 1/f_free); both terms are positive only for
 * factors above the golden ratio (~1.618).
 */
struct Occupancy {
  double occupied_factor = 3.0;
  double free_factor = 2.0;
  double max_confidence = 5.0;  ///< Upper bound on a cell's log-odds
};

/// Scan-to-scan ICP used to track the sensor pose.
struct Odometry {
  bool enabled = true;
  bool use_spatial_index = true;
  int max_iterations = 20;
  double mse_interval_threshold = 0.01;
  double voxel_size = 0.0;  ///< Registration downsampling, 0 disables
};

struct Mapper {
  std::vector<std::size_t> dimensions;  ///< Cells per axis, size must match N
  double resolution = 1.0;              ///< Pose scale, cells per sensor unit
  Occupancy occupancy;
  Odometry odometry;
};

}  // namespace icpmap::config

#endif  // ICPMAP_CONFIG_MAPPER_HPP
