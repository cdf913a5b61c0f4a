// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * room_scan.hpp
 *
 * Simulated planar range scans of a rectangular room.
 */

#ifndef EXAMPLES_COMMON_ROOM_SCAN_HPP
#define EXAMPLES_COMMON_ROOM_SCAN_HPP

#include <icpmap/point_types.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <random>

namespace examples {

struct Room {
  float half_width = 4.0f;   ///< Walls at x = +-half_width [m]
  float half_height = 2.5f;  ///< Walls at y = +-half_height [m]
};

/**
 * @brief Cast `beams` rays from `origin` and return wall hits in the sensor
 *        frame, with Gaussian range noise.
 */
inline icpmap::PointCloud2f scanRoom(const Room& room,
                                     const icpmap::Point2f& origin,
                                     int beams, float range_noise,
                                     std::uint32_t seed) {
  constexpr float kTwoPi = 6.283185307f;
  std::mt19937 rng(seed);
  std::normal_distribution<float> noise(0.0f, range_noise);

  icpmap::PointCloud2f cloud;
  cloud.reserve(beams);
  for (int i = 0; i < beams; ++i) {
    const float angle = kTwoPi * static_cast<float>(i) / beams;
    const icpmap::Point2f dir(std::cos(angle), std::sin(angle));

    // Distance to the first wall along dir.
    float range = std::numeric_limits<float>::max();
    if (std::abs(dir.x()) > 1e-6f) {
      const float wall = dir.x() > 0 ? room.half_width : -room.half_width;
      range = std::min(range, (wall - origin.x()) / dir.x());
    }
    if (std::abs(dir.y()) > 1e-6f) {
      const float wall = dir.y() > 0 ? room.half_height : -room.half_height;
      range = std::min(range, (wall - origin.y()) / dir.y());
    }
    cloud.push_back(dir * (range + noise(rng)));
  }
  return cloud;
}

}  // namespace examples

#endif  // EXAMPLES_COMMON_ROOM_SCAN_HPP
