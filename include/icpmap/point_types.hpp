// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * point_types.hpp
 *
 * Point, point cloud and grid index aliases for icpmap.
 */

#ifndef ICPMAP_POINT_TYPES_HPP
#define ICPMAP_POINT_TYPES_HPP

#include <Eigen/Core>
#include <vector>

namespace icpmap {

/// Fixed-dimension point with scalar T (float or double), N in {2, 3}.
template <typename T, int N>
using Point = Eigen::Matrix<T, N, 1>;

/// Ordered, possibly empty sequence of points. Duplicates are allowed.
template <typename T, int N>
using PointCloud = std::vector<Point<T, N>>;

/// Integer cell coordinate on an N-dimensional grid.
template <int N>
using GridIndex = Eigen::Matrix<int, N, 1>;

using Point2f = Point<float, 2>;
using Point3f = Point<float, 3>;
using Point2d = Point<double, 2>;
using Point3d = Point<double, 3>;

using PointCloud2f = PointCloud<float, 2>;
using PointCloud3f = PointCloud<float, 3>;
using PointCloud2d = PointCloud<double, 2>;
using PointCloud3d = PointCloud<double, 3>;

}  // namespace icpmap

#endif  // ICPMAP_POINT_TYPES_HPP
