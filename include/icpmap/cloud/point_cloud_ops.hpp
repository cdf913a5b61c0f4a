// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * point_cloud_ops.hpp
 *
 * Small whole-cloud utilities: centroid, rigid transform, finiteness check,
 * lexicographic sort and voxel-grid downsampling.
 */

#ifndef ICPMAP_CLOUD_POINT_CLOUD_OPS_HPP
#define ICPMAP_CLOUD_POINT_CLOUD_OPS_HPP

#include <algorithm>
#include <cmath>
#include <optional>
#include <stdexcept>
#include <vector>

#include "icpmap/mapping/grid_index_hash.hpp"
#include "icpmap/point_types.hpp"
#include "icpmap/rigid_transform.hpp"

namespace icpmap {

/// Arithmetic mean of all points. The origin for an empty cloud.
template <typename T, int N>
Point<T, N> calculateCentroid(const PointCloud<T, N>& cloud) {
  Point<T, N> sum = Point<T, N>::Zero();
  if (cloud.empty()) return sum;
  for (const auto& p : cloud) sum += p;
  return sum / static_cast<T>(cloud.size());
}

template <typename T, int N>
PointCloud<T, N> transformCloud(const PointCloud<T, N>& cloud,
                                const RigidTransform<T, N>& transform) {
  PointCloud<T, N> out;
  out.reserve(cloud.size());
  for (const auto& p : cloud) out.push_back(transform.transformPoint(p));
  return out;
}

/// True if any coordinate is NaN or infinite.
template <typename T, int N>
bool hasNonFinite(const PointCloud<T, N>& cloud) {
  return std::any_of(cloud.begin(), cloud.end(),
                     [](const Point<T, N>& p) { return !p.allFinite(); });
}

namespace detail {

template <typename T, int N>
bool lexLess(const Point<T, N>& a, const Point<T, N>& b) {
  for (int i = 0; i < N; ++i) {
    if (a[i] < b[i]) return true;
    if (b[i] < a[i]) return false;
  }
  return false;
}

template <typename T, int N>
bool hasNaN(const PointCloud<T, N>& cloud) {
  return std::any_of(cloud.begin(), cloud.end(),
                     [](const Point<T, N>& p) { return p.hasNaN(); });
}

}  // namespace detail

/**
 * @brief Sort points lexicographically (x, then y, then z) in place.
 * @return false, leaving the cloud untouched, if any coordinate is NaN
 */
template <typename T, int N>
bool lexSortInPlace(PointCloud<T, N>& cloud) {
  if (detail::hasNaN(cloud)) return false;
  std::sort(cloud.begin(), cloud.end(), detail::lexLess<T, N>);
  return true;
}

/// Sorted copy, or nullopt if any coordinate is NaN.
template <typename T, int N>
std::optional<PointCloud<T, N>> lexSort(const PointCloud<T, N>& cloud) {
  PointCloud<T, N> sorted = cloud;
  if (!lexSortInPlace(sorted)) return std::nullopt;
  return sorted;
}

/**
 * @brief Replace all points sharing a voxel by their centroid.
 *
 * Voxel keys are floor(p / voxel_size) per axis. Output order follows the
 * first point seen in each voxel.
 *
 * @throws std::invalid_argument if voxel_size is not positive
 */
template <typename T, int N>
PointCloud<T, N> downsampleVoxel(const PointCloud<T, N>& cloud, T voxel_size) {
  if (!(voxel_size > T(0))) {
    throw std::invalid_argument("downsampleVoxel: voxel_size must be > 0");
  }

  struct Accumulator {
    Point<T, N> sum = Point<T, N>::Zero();
    std::size_t count = 0;
  };

  CellMap<N, std::size_t> slot_of;
  std::vector<Accumulator> voxels;
  for (const auto& p : cloud) {
    GridIndex<N> key;
    for (int i = 0; i < N; ++i) {
      key(i) = static_cast<int>(std::floor(p[i] / voxel_size));
    }
    auto [it, inserted] = slot_of.try_emplace(key, voxels.size());
    if (inserted) voxels.emplace_back();
    Accumulator& acc = voxels[it->second];
    acc.sum += p;
    ++acc.count;
  }

  PointCloud<T, N> out;
  out.reserve(voxels.size());
  for (const auto& acc : voxels) {
    out.push_back(acc.sum / static_cast<T>(acc.count));
  }
  return out;
}

}  // namespace icpmap

#endif  // ICPMAP_CLOUD_POINT_CLOUD_OPS_HPP
