// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * occupancy_grid.hpp
 *
 * Dense N-dimensional log-odds occupancy grid.
 *
 * Each cell stores a log-odds belief and the 8-bit index of the frame that
 * last touched it (0 = never). Cells are stored row-major: the last axis is
 * contiguous. Updates outside the grid are ignored.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef ICPMAP_MAPPING_OCCUPANCY_GRID_HPP
#define ICPMAP_MAPPING_OCCUPANCY_GRID_HPP

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <vector>

#include "icpmap/point_types.hpp"

namespace icpmap {

template <typename T, int N>
class OccupancyGrid {
 public:
  using Index = GridIndex<N>;
  using Dimensions = std::array<std::size_t, N>;

  struct Cell {
    T log_odds = T(0);
    std::uint8_t last_update_frame = 0;
  };

  /**
   * @brief Allocate a grid with every cell at log-odds 0 (p = 0.5).
   *
   * Factors are converted once: positive = ln(f_occ - 1/f_occ),
   * negative = ln(f_free - 1/f_free).
   *
   * @throws std::invalid_argument on a zero dimension, a factor <= 1 or a
   *         non-positive max_confidence
   */
  OccupancyGrid(const Dimensions& dimensions, T occupied_factor,
                T free_factor, T max_confidence);

  /**
   * @brief Record a hit at `index` during `frame`.
   *
   * No-op once the cell has reached max confidence. A second touch in the
   * same frame adds both factors; otherwise the positive factor is added
   * and the cell is stamped with `frame`. The result never exceeds
   * max confidence.
   */
  void occupiedUpdate(const Index& index, std::uint8_t frame);

  /// Record a pass-through at `index`, at most once per frame. No floor.
  void freeUpdate(const Index& index, std::uint8_t frame);

  /// Occupancy probability e^l / (1 + e^l), nullopt outside the grid.
  std::optional<T> probability(const Index& index) const;
  std::optional<T> logOdds(const Index& index) const;
  std::optional<std::uint8_t> lastUpdateFrame(const Index& index) const;

  bool isInside(const Index& index) const;

  const Dimensions& dimensions() const noexcept { return dimensions_; }
  std::size_t size() const noexcept { return cells_.size(); }
  T positiveFactor() const noexcept { return positive_factor_; }
  T negativeFactor() const noexcept { return negative_factor_; }
  T maxConfidence() const noexcept { return max_confidence_; }

 private:
  std::optional<std::size_t> linearIndex(const Index& index) const;

  Dimensions dimensions_;
  std::array<std::size_t, N> strides_;
  std::vector<Cell> cells_;
  T positive_factor_;
  T negative_factor_;
  T max_confidence_;
};

// ─── OccupancyGrid inline definitions ───────────────────────────────────────

template <typename T, int N>
OccupancyGrid<T, N>::OccupancyGrid(const Dimensions& dimensions,
                                   T occupied_factor, T free_factor,
                                   T max_confidence)
    : dimensions_(dimensions) {
  if (!(occupied_factor > T(1)) || !(free_factor > T(1))) {
    throw std::invalid_argument(
        "OccupancyGrid: confidence factors must be > 1");
  }
  if (!(max_confidence > T(0)) || !std::isfinite(max_confidence)) {
    throw std::invalid_argument(
        "OccupancyGrid: max_confidence must be finite and > 0");
  }

  std::size_t total = 1;
  for (int axis = N - 1; axis >= 0; --axis) {
    if (dimensions_[axis] == 0) {
      throw std::invalid_argument("OccupancyGrid: dimensions must be > 0");
    }
    strides_[axis] = total;
    total *= dimensions_[axis];
  }
  cells_.assign(total, Cell{});

  positive_factor_ = std::log(occupied_factor - T(1) / occupied_factor);
  negative_factor_ = std::log(free_factor - T(1) / free_factor);
  max_confidence_ = max_confidence;
}

template <typename T, int N>
std::optional<std::size_t> OccupancyGrid<T, N>::linearIndex(
    const Index& index) const {
  std::size_t linear = 0;
  for (int axis = 0; axis < N; ++axis) {
    if (index(axis) < 0 ||
        static_cast<std::size_t>(index(axis)) >= dimensions_[axis]) {
      return std::nullopt;
    }
    linear += static_cast<std::size_t>(index(axis)) * strides_[axis];
  }
  return linear;
}

template <typename T, int N>
bool OccupancyGrid<T, N>::isInside(const Index& index) const {
  return linearIndex(index).has_value();
}

template <typename T, int N>
void OccupancyGrid<T, N>::occupiedUpdate(const Index& index,
                                         std::uint8_t frame) {
  const auto linear = linearIndex(index);
  if (!linear) return;
  Cell& cell = cells_[*linear];
  if (cell.log_odds >= max_confidence_) return;

  if (cell.last_update_frame == frame) {
    cell.log_odds += positive_factor_ + negative_factor_;
  } else {
    cell.last_update_frame = frame;
    cell.log_odds += positive_factor_;
  }
  cell.log_odds = std::min(cell.log_odds, max_confidence_);
}

template <typename T, int N>
void OccupancyGrid<T, N>::freeUpdate(const Index& index, std::uint8_t frame) {
  const auto linear = linearIndex(index);
  if (!linear) return;
  Cell& cell = cells_[*linear];
  if (cell.last_update_frame == frame) return;
  cell.log_odds -= negative_factor_;
  cell.last_update_frame = frame;
}

template <typename T, int N>
std::optional<T> OccupancyGrid<T, N>::probability(const Index& index) const {
  const auto l = logOdds(index);
  if (!l) return std::nullopt;
  return std::exp(*l) / (T(1) + std::exp(*l));
}

template <typename T, int N>
std::optional<T> OccupancyGrid<T, N>::logOdds(const Index& index) const {
  const auto linear = linearIndex(index);
  if (!linear) return std::nullopt;
  return cells_[*linear].log_odds;
}

template <typename T, int N>
std::optional<std::uint8_t> OccupancyGrid<T, N>::lastUpdateFrame(
    const Index& index) const {
  const auto linear = linearIndex(index);
  if (!linear) return std::nullopt;
  return cells_[*linear].last_update_frame;
}

extern template class OccupancyGrid<float, 2>;
extern template class OccupancyGrid<float, 3>;
extern template class OccupancyGrid<double, 2>;
extern template class OccupancyGrid<double, 3>;

}  // namespace icpmap

#endif  // ICPMAP_MAPPING_OCCUPANCY_GRID_HPP
