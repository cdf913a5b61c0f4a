// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * nearest_neighbour.hpp
 *
 * Brute-force nearest neighbour, used when no spatial index is built and as
 * the reference the k-d tree is checked against.
 */

#ifndef ICPMAP_SEARCH_NEAREST_NEIGHBOUR_HPP
#define ICPMAP_SEARCH_NEAREST_NEIGHBOUR_HPP

#include <limits>
#include <optional>

#include "icpmap/point_types.hpp"

namespace icpmap {

/// Linear scan. Ties keep the earliest point; empty cloud gives nullopt.
template <typename T, int N>
std::optional<Point<T, N>> findNearestNeighbourNaive(
    const Point<T, N>& target, const PointCloud<T, N>& cloud) {
  if (cloud.empty()) return std::nullopt;

  const Point<T, N>* best = &cloud.front();
  T best_dist = std::numeric_limits<T>::max();
  for (const auto& p : cloud) {
    const T dist = (p - target).squaredNorm();
    if (dist < best_dist) {
      best_dist = dist;
      best = &p;
    }
  }
  return *best;
}

}  // namespace icpmap

#endif  // ICPMAP_SEARCH_NEAREST_NEIGHBOUR_HPP
