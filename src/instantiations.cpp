// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * instantiations.cpp
 *
 * Explicit instantiations for float/double in 2D and 3D, matching the
 * extern template declarations in the headers.
 */

#include "icpmap/mapping/incremental_mapper.hpp"
#include "icpmap/mapping/occupancy_grid.hpp"
#include "icpmap/registration/icp.hpp"
#include "icpmap/search/kd_tree.hpp"

namespace icpmap {

template class KDTree<float, 2>;
template class KDTree<float, 3>;
template class KDTree<double, 2>;
template class KDTree<double, 3>;

template ICPResult<float, 2> icp<float, 2>(const PointCloud<float, 2>&,
                                           const PointCloud<float, 2>&,
                                           const ICPConfiguration<float>&);
template ICPResult<float, 3> icp<float, 3>(const PointCloud<float, 3>&,
                                           const PointCloud<float, 3>&,
                                           const ICPConfiguration<float>&);
template ICPResult<double, 2> icp<double, 2>(const PointCloud<double, 2>&,
                                             const PointCloud<double, 2>&,
                                             const ICPConfiguration<double>&);
template ICPResult<double, 3> icp<double, 3>(const PointCloud<double, 3>&,
                                             const PointCloud<double, 3>&,
                                             const ICPConfiguration<double>&);

template class OccupancyGrid<float, 2>;
template class OccupancyGrid<float, 3>;
template class OccupancyGrid<double, 2>;
template class OccupancyGrid<double, 3>;

template class IncrementalMapper<float, 2>;
template class IncrementalMapper<float, 3>;
template class IncrementalMapper<double, 2>;
template class IncrementalMapper<double, 3>;

}  // namespace icpmap
