// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * grid_index_hash.hpp
 *
 * Hash utilities for GridIndex<N> used as unordered_map keys.
 *
 *  Created on: Feb 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef ICPMAP_MAPPING_GRID_INDEX_HASH_HPP
#define ICPMAP_MAPPING_GRID_INDEX_HASH_HPP

#include <cstdint>
#include <functional>
#include <unordered_map>

#include "icpmap/point_types.hpp"

namespace icpmap {

template <int N>
struct IndexHash {
  std::size_t operator()(const GridIndex<N>& idx) const {
    std::size_t seed = 0;
    for (int i = 0; i < N; ++i) {
      const auto v = static_cast<uint64_t>(static_cast<uint32_t>(idx(i)));
      seed ^= std::hash<uint64_t>()(v) + 0x9e3779b97f4a7c15ULL + (seed << 6) +
              (seed >> 2);
    }
    return seed;
  }
};

template <int N>
struct IndexEqual {
  bool operator()(const GridIndex<N>& a, const GridIndex<N>& b) const {
    return a == b;
  }
};

template <int N, typename V>
using CellMap =
    std::unordered_map<GridIndex<N>, V, IndexHash<N>, IndexEqual<N>>;

}  // namespace icpmap

#endif  // ICPMAP_MAPPING_GRID_INDEX_HASH_HPP
