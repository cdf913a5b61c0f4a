// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * rigid_transform.hpp
 *
 * Dimension-generic rigid and similarity transforms.
 *
 * RotationTraits<T, N> selects the rotation representation per dimension
 * (Eigen::Rotation2D in 2D, unit Eigen::Quaternion in 3D). Everything else
 * is written once against that trait.
 *
 *  Created on: Jan 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef ICPMAP_RIGID_TRANSFORM_HPP
#define ICPMAP_RIGID_TRANSFORM_HPP

#include <Eigen/Core>
#include <Eigen/Geometry>

#include "icpmap/point_types.hpp"

namespace icpmap {

template <typename T, int N>
struct RotationTraits;

template <typename T>
struct RotationTraits<T, 2> {
  using Type = Eigen::Rotation2D<T>;
  using Matrix = Eigen::Matrix<T, 2, 2>;

  static Type identity() { return Type(T(0)); }
  static Type fromMatrix(const Matrix& m) {
    Type r;
    r.fromRotationMatrix(m);
    return r;
  }
  static Matrix toMatrix(const Type& r) { return r.toRotationMatrix(); }
  static Type compose(const Type& a, const Type& b) { return a * b; }
  static Type inverse(const Type& r) { return r.inverse(); }
  static Point<T, 2> apply(const Type& r, const Point<T, 2>& v) {
    return r * v;
  }
};

template <typename T>
struct RotationTraits<T, 3> {
  using Type = Eigen::Quaternion<T>;
  using Matrix = Eigen::Matrix<T, 3, 3>;

  static Type identity() { return Type::Identity(); }
  static Type fromMatrix(const Matrix& m) { return Type(m).normalized(); }
  static Matrix toMatrix(const Type& r) { return r.toRotationMatrix(); }
  static Type compose(const Type& a, const Type& b) {
    return (a * b).normalized();
  }
  static Type inverse(const Type& r) { return r.conjugate(); }
  static Point<T, 3> apply(const Type& r, const Point<T, 3>& v) {
    return r * v;
  }
};

/**
 * @brief Proper rigid transform (rotation followed by translation).
 *
 * Maps p to R * p + t. Composition `a * b` applies b first, then a.
 */
template <typename T, int N>
class RigidTransform {
 public:
  using Traits = RotationTraits<T, N>;
  using Rotation = typename Traits::Type;
  using Vector = Point<T, N>;
  using Matrix = Eigen::Matrix<T, N, N>;
  using HomogeneousMatrix = Eigen::Matrix<T, N + 1, N + 1>;

  RigidTransform()
      : translation_(Vector::Zero()), rotation_(Traits::identity()) {}
  RigidTransform(const Vector& translation, const Rotation& rotation)
      : translation_(translation), rotation_(rotation) {}

  static RigidTransform Identity() { return RigidTransform(); }

  /// Build from a proper rotation matrix (det = +1) and a translation.
  static RigidTransform fromParts(const Matrix& rotation,
                                  const Vector& translation) {
    return RigidTransform(translation, Traits::fromMatrix(rotation));
  }

  const Vector& translation() const noexcept { return translation_; }
  Vector& translation() noexcept { return translation_; }
  const Rotation& rotation() const noexcept { return rotation_; }
  Rotation& rotation() noexcept { return rotation_; }

  Matrix rotationMatrix() const { return Traits::toMatrix(rotation_); }

  HomogeneousMatrix matrix() const;

  Vector transformPoint(const Vector& p) const {
    return Traits::apply(rotation_, p) + translation_;
  }

  Vector transformVector(const Vector& v) const {
    return Traits::apply(rotation_, v);
  }

  RigidTransform inverse() const;

  RigidTransform operator*(const RigidTransform& other) const {
    return RigidTransform(transformPoint(other.translation_),
                          Traits::compose(rotation_, other.rotation_));
  }

 private:
  Vector translation_;
  Rotation rotation_;
};

/**
 * @brief Rigid transform with a uniform scale applied before it.
 *
 * Maps p to R * (s * p) + t. The mapper uses it as world-to-cell pose:
 * s is the grid resolution, t is the sensor origin in cell coordinates.
 */
template <typename T, int N>
class Similarity {
 public:
  using Isometry = RigidTransform<T, N>;
  using Rotation = typename Isometry::Rotation;
  using Vector = typename Isometry::Vector;

  Similarity() : scale_(T(1)) {}
  Similarity(const Vector& translation, const Rotation& rotation, T scale)
      : isometry_(translation, rotation), scale_(scale) {}

  const Isometry& isometry() const noexcept { return isometry_; }
  const Vector& translation() const noexcept {
    return isometry_.translation();
  }
  const Rotation& rotation() const noexcept { return isometry_.rotation(); }
  T scale() const noexcept { return scale_; }

  Vector transformPoint(const Vector& p) const {
    return isometry_.transformPoint(scale_ * p);
  }

  /// Shift the origin by `delta`, expressed in the output (cell) frame.
  void appendTranslation(const Vector& delta) {
    isometry_.translation() += delta;
  }

  /// Pre-multiply the rotation; the translation (center) stays fixed.
  void appendRotationWrtCenter(const Rotation& delta) {
    isometry_.rotation() =
        Isometry::Traits::compose(delta, isometry_.rotation());
  }

 private:
  Isometry isometry_;
  T scale_;
};

// ─── RigidTransform inline definitions ──────────────────────────────────────

template <typename T, int N>
typename RigidTransform<T, N>::HomogeneousMatrix
RigidTransform<T, N>::matrix() const {
  HomogeneousMatrix m = HomogeneousMatrix::Identity();
  m.template topLeftCorner<N, N>() = rotationMatrix();
  m.template topRightCorner<N, 1>() = translation_;
  return m;
}

template <typename T, int N>
RigidTransform<T, N> RigidTransform<T, N>::inverse() const {
  const Rotation inv = Traits::inverse(rotation_);
  return RigidTransform(-Traits::apply(inv, translation_), inv);
}

using RigidTransform2f = RigidTransform<float, 2>;
using RigidTransform3f = RigidTransform<float, 3>;
using RigidTransform2d = RigidTransform<double, 2>;
using RigidTransform3d = RigidTransform<double, 3>;

}  // namespace icpmap

#endif  // ICPMAP_RIGID_TRANSFORM_HPP
