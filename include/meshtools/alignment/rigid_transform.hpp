// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * rigid_transform.hpp
 *
 * Closed-form rigid registration from point correspondences (Kabsch).
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef MESHTOOLS_ALIGNMENT_RIGID_TRANSFORM_HPP
#define MESHTOOLS_ALIGNMENT_RIGID_TRANSFORM_HPP

#include <Eigen/Geometry>
#include <stdexcept>
#include <string>
#include <vector>

namespace meshtools {

/// A single (source, target) point pair.
struct PointCorrespondence {
  Eigen::Vector3d source = Eigen::Vector3d::Zero();
  Eigen::Vector3d target = Eigen::Vector3d::Zero();
};

/**
 * @brief Proper rigid motion: x' = R·x + t with det(R) = +1.
 */
struct RigidTransform {
  Eigen::Matrix3d rotation = Eigen::Matrix3d::Identity();
  Eigen::Vector3d translation = Eigen::Vector3d::Zero();

  static RigidTransform identity() { return {}; }

  /// Build from a 4x4 homogeneous matrix (bottom row is ignored)
  static RigidTransform fromMatrix(const Eigen::Matrix4d& T);

  static RigidTransform fromIsometry(const Eigen::Isometry3d& T);

  /// 4x4 homogeneous matrix [[R, t], [0, 0, 0, 1]]
  Eigen::Matrix4d matrix() const;

  Eigen::Isometry3d isometry() const;

  Eigen::Vector3d apply(const Eigen::Vector3d& p) const {
    return rotation * p + translation;
  }

  RigidTransform inverse() const;
};

/// Fewer than three correspondences were supplied.
class InsufficientCorrespondencesError : public std::invalid_argument {
 public:
  InsufficientCorrespondencesError(size_t given, size_t required)
      : std::invalid_argument(
            "At least " + std::to_string(required) +
            " point correspondences are required, got " +
            std::to_string(given)),
        given_(given) {}

  size_t given() const noexcept { return given_; }

 private:
  size_t given_;
};

/// Point sets are coincident or collinear; the rotation is underdetermined.
class DegenerateGeometryError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/// Minimum number of pairs accepted by estimateRigidTransform().
constexpr size_t kMinCorrespondences = 3;

/**
 * @brief Least-squares rigid transform mapping sources onto targets.
 *
 * Kabsch / orthogonal Procrustes:
 *   1. Center both point sets on their centroids
 *   2. H = Σ (s_i - s̄)(t_i - t̄)ᵀ
 *   3. H = UΣVᵀ
 *   4. R = V·diag(1, 1, sign(det(VUᵀ)))·Uᵀ
 *   5. t = t̄ - R·s̄
 *
 * Every pair contributes independently (duplicates are kept). The result
 * is deterministic and always a proper rotation.
 *
 * @param pairs Correspondences (order irrelevant)
 * @param rank_tolerance Relative threshold on the second singular value of
 *        H below which the input is treated as rank deficient
 * @throws InsufficientCorrespondencesError fewer than 3 pairs
 * @throws DegenerateGeometryError coincident or collinear point sets
 * @throws std::invalid_argument non-finite coordinates
 */
RigidTransform estimateRigidTransform(
    const std::vector<PointCorrespondence>& pairs,
    double rank_tolerance = 1e-9);

/// RMS residual ‖R·s + t - t‖ over all pairs (0 for an empty set).
double rmsError(const std::vector<PointCorrespondence>& pairs,
                const RigidTransform& transform);

}  // namespace meshtools

#endif  // MESHTOOLS_ALIGNMENT_RIGID_TRANSFORM_HPP
