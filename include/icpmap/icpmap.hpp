// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * icpmap.hpp
 *
 * Umbrella header: registration, spatial search and occupancy mapping.
 */

#ifndef ICPMAP_ICPMAP_HPP
#define ICPMAP_ICPMAP_HPP

#include "icpmap/cloud/point_cloud_ops.hpp"
#include "icpmap/config/icpmap.hpp"
#include "icpmap/mapping/incremental_mapper.hpp"
#include "icpmap/mapping/occupancy_grid.hpp"
#include "icpmap/mapping/raycasting.hpp"
#include "icpmap/point_types.hpp"
#include "icpmap/registration/icp.hpp"
#include "icpmap/registration/rigid_alignment.hpp"
#include "icpmap/rigid_transform.hpp"
#include "icpmap/search/kd_tree.hpp"
#include "icpmap/search/nearest_neighbour.hpp"

#endif  // ICPMAP_ICPMAP_HPP
