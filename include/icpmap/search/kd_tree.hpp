// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * kd_tree.hpp
 *
 * Incremental k-d tree over fixed-dimension points.
 *
 * Nodes split on axis (depth % N). Coordinates strictly less than the
 * node's go left, everything else goes right. Each node owns its children
 * exclusively, so the tree is a plain hierarchy with no shared state.
 *
 *  Created on: Jan 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef ICPMAP_SEARCH_KD_TREE_HPP
#define ICPMAP_SEARCH_KD_TREE_HPP

#include <cstddef>
#include <memory>
#include <optional>

#include "icpmap/point_types.hpp"

namespace icpmap {

template <typename T, int N>
class KDTree {
 public:
  using PointT = Point<T, N>;
  using Cloud = PointCloud<T, N>;

  KDTree() = default;

  /// Build by inserting every point of `cloud` in order.
  explicit KDTree(const Cloud& cloud);

  KDTree(KDTree&&) noexcept = default;
  KDTree& operator=(KDTree&&) noexcept = default;
  KDTree(const KDTree&) = delete;
  KDTree& operator=(const KDTree&) = delete;

  /**
   * @brief Insert a point.
   *
   * A point equal to an existing node is rejected when the descent reaches
   * that node's empty right slot through a coordinate tie. Ties that can
   * keep descending go right and are stored.
   *
   * @return true if the point was stored
   */
  bool insert(const PointT& point);

  /// Closest stored point by Euclidean distance, nullopt when empty.
  std::optional<PointT> nearest(const PointT& target) const;

  /// In-order visit (left subtree, node, right subtree).
  template <typename Visitor>
  void traverse(Visitor&& visitor) const;

  /// In-order visit with mutable access. Moving a point along its node's
  /// split axis breaks the ordering; callers keep edits order-preserving.
  template <typename Visitor>
  void traverseMut(Visitor&& visitor);

  std::size_t size() const noexcept { return size_; }
  bool empty() const noexcept { return size_ == 0; }

 private:
  struct Node {
    explicit Node(const PointT& p) : point(p) {}
    PointT point;
    std::unique_ptr<Node> left;
    std::unique_ptr<Node> right;
  };

  static const PointT& nearestIn(const Node& node, const PointT& target,
                                 int depth);

  template <typename Visitor>
  static void visit(const Node* node, Visitor& visitor);
  template <typename Visitor>
  static void visitMut(Node* node, Visitor& visitor);

  std::unique_ptr<Node> root_;
  std::size_t size_ = 0;
};

// ─── KDTree inline definitions ──────────────────────────────────────────────

template <typename T, int N>
KDTree<T, N>::KDTree(const Cloud& cloud) {
  for (const auto& p : cloud) insert(p);
}

template <typename T, int N>
bool KDTree<T, N>::insert(const PointT& point) {
  std::unique_ptr<Node>* slot = &root_;
  int depth = 0;
  while (*slot) {
    Node& node = **slot;
    const int axis = depth % N;
    const bool tie = point[axis] == node.point[axis];
    std::unique_ptr<Node>& next =
        point[axis] < node.point[axis] ? node.left : node.right;
    if (!next && tie && point == node.point) return false;
    slot = &next;
    ++depth;
  }
  *slot = std::make_unique<Node>(point);
  ++size_;
  return true;
}

template <typename T, int N>
std::optional<typename KDTree<T, N>::PointT> KDTree<T, N>::nearest(
    const PointT& target) const {
  if (!root_) return std::nullopt;
  return nearestIn(*root_, target, 0);
}

template <typename T, int N>
const typename KDTree<T, N>::PointT& KDTree<T, N>::nearestIn(
    const Node& node, const PointT& target, int depth) {
  const int axis = depth % N;
  const bool go_left = target[axis] < node.point[axis];
  const Node* near_side = go_left ? node.left.get() : node.right.get();
  const Node* far_side = go_left ? node.right.get() : node.left.get();

  const PointT* best =
      near_side ? &nearestIn(*near_side, target, depth + 1) : &node.point;
  T best_dist = (*best - target).squaredNorm();

  const T node_dist = (node.point - target).squaredNorm();
  if (node_dist < best_dist) {
    best = &node.point;
    best_dist = node_dist;
  }

  // The far side can only win if the splitting plane is closer than best.
  const T axis_dist = target[axis] - node.point[axis];
  if (far_side && axis_dist * axis_dist < best_dist) {
    const PointT& candidate = nearestIn(*far_side, target, depth + 1);
    if ((candidate - target).squaredNorm() < best_dist) best = &candidate;
  }
  return *best;
}

template <typename T, int N>
template <typename Visitor>
void KDTree<T, N>::traverse(Visitor&& visitor) const {
  visit(root_.get(), visitor);
}

template <typename T, int N>
template <typename Visitor>
void KDTree<T, N>::traverseMut(Visitor&& visitor) {
  visitMut(root_.get(), visitor);
}

template <typename T, int N>
template <typename Visitor>
void KDTree<T, N>::visit(const Node* node, Visitor& visitor) {
  if (!node) return;
  visit(node->left.get(), visitor);
  visitor(static_cast<const PointT&>(node->point));
  visit(node->right.get(), visitor);
}

template <typename T, int N>
template <typename Visitor>
void KDTree<T, N>::visitMut(Node* node, Visitor& visitor) {
  if (!node) return;
  visitMut(node->left.get(), visitor);
  visitor(node->point);
  visitMut(node->right.get(), visitor);
}

extern template class KDTree<float, 2>;
extern template class KDTree<float, 3>;
extern template class KDTree<double, 2>;
extern template class KDTree<double, 3>;

}  // namespace icpmap

#endif  // ICPMAP_SEARCH_KD_TREE_HPP
