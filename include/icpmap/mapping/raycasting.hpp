// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * raycasting.hpp
 *
 * N-dimensional Bresenham line walk between two grid cells.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef ICPMAP_MAPPING_RAYCASTING_HPP
#define ICPMAP_MAPPING_RAYCASTING_HPP

#include <array>
#include <cmath>
#include <cstdlib>
#include <vector>

#include "icpmap/point_types.hpp"

namespace icpmap {

/**
 * @brief Cells on the line from `start` to `end`, both included.
 *
 * Coordinates are floored to their cell first. The walk steps the dominant
 * axis (largest |delta|, later axis on ties) once per cell and advances
 * each other axis when its accumulated error reaches 1 - 1/(N+1). The
 * result holds exactly max|delta| + 1 cells.
 */
template <typename T, int N>
std::vector<GridIndex<N>> plotLine(const Point<T, N>& start,
                                   const Point<T, N>& end) {
  GridIndex<N> current;
  GridIndex<N> target;
  GridIndex<N> delta;
  GridIndex<N> step;
  for (int i = 0; i < N; ++i) {
    current(i) = static_cast<int>(std::floor(start[i]));
    target(i) = static_cast<int>(std::floor(end[i]));
    delta(i) = std::abs(target(i) - current(i));
    step(i) = target(i) >= current(i) ? 1 : -1;
  }

  int primary = 0;
  for (int i = 0; i < N; ++i) {
    if (delta(i) >= delta(primary)) primary = i;
  }

  const double threshold = 1.0 - 1.0 / static_cast<double>(N + 1);
  std::array<double, N> error{};

  std::vector<GridIndex<N>> cells;
  cells.reserve(static_cast<std::size_t>(delta(primary)) + 1);
  while (current(primary) != target(primary)) {
    cells.push_back(current);
    for (int i = 0; i < N; ++i) {
      if (i == primary) continue;
      error[i] += static_cast<double>(delta(i)) / delta(primary);
      if (error[i] >= threshold) {
        current(i) += step(i);
        error[i] -= 1.0;
      }
    }
    current(primary) += step(primary);
  }
  cells.push_back(target);
  return cells;
}

}  // namespace icpmap

#endif  // ICPMAP_MAPPING_RAYCASTING_HPP
