// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "meshtools/alignment/rigid_transform.hpp"

#include <Eigen/SVD>
#include <cmath>

namespace meshtools {

RigidTransform RigidTransform::fromMatrix(const Eigen::Matrix4d& T) {
  RigidTransform out;
  out.rotation = T.block<3, 3>(0, 0);
  out.translation = T.block<3, 1>(0, 3);
  return out;
}

RigidTransform RigidTransform::fromIsometry(const Eigen::Isometry3d& T) {
  return fromMatrix(T.matrix());
}

Eigen::Matrix4d RigidTransform::matrix() const {
  Eigen::Matrix4d T = Eigen::Matrix4d::Identity();
  T.block<3, 3>(0, 0) = rotation;
  T.block<3, 1>(0, 3) = translation;
  return T;
}

Eigen::Isometry3d RigidTransform::isometry() const {
  Eigen::Isometry3d T = Eigen::Isometry3d::Identity();
  T.linear() = rotation;
  T.translation() = translation;
  return T;
}

RigidTransform RigidTransform::inverse() const {
  RigidTransform inv;
  inv.rotation = rotation.transpose();
  inv.translation = -inv.rotation * translation;
  return inv;
}

RigidTransform estimateRigidTransform(
    const std::vector<PointCorrespondence>& pairs, double rank_tolerance) {
  if (pairs.size() < kMinCorrespondences) {
    throw InsufficientCorrespondencesError(pairs.size(), kMinCorrespondences);
  }

  // Step 1: centroids
  Eigen::Vector3d src_centroid = Eigen::Vector3d::Zero();
  Eigen::Vector3d tgt_centroid = Eigen::Vector3d::Zero();
  for (const auto& pair : pairs) {
    if (!pair.source.allFinite() || !pair.target.allFinite()) {
      throw std::invalid_argument(
          "Point correspondences must have finite coordinates");
    }
    src_centroid += pair.source;
    tgt_centroid += pair.target;
  }
  const double n = static_cast<double>(pairs.size());
  src_centroid /= n;
  tgt_centroid /= n;

  // Steps 2-3: cross-covariance of the centered sets
  Eigen::Matrix3d H = Eigen::Matrix3d::Zero();
  for (const auto& pair : pairs) {
    H += (pair.source - src_centroid) * (pair.target - tgt_centroid).transpose();
  }

  // Step 4: SVD
  Eigen::JacobiSVD<Eigen::Matrix3d> svd(H,
                                        Eigen::ComputeFullU | Eigen::ComputeFullV);
  const Eigen::Vector3d& sv = svd.singularValues();

  // Rank < 2 leaves the rotation axis undetermined
  if (!(sv(0) > 0.0) || sv(1) <= rank_tolerance * sv(0)) {
    throw DegenerateGeometryError(
        "Correspondences are coincident or collinear (singular values " +
        std::to_string(sv(0)) + ", " + std::to_string(sv(1)) + ", " +
        std::to_string(sv(2)) + ")");
  }

  const Eigen::Matrix3d& U = svd.matrixU();
  const Eigen::Matrix3d& V = svd.matrixV();

  // Steps 5-6: reflection correction
  const double d = (V * U.transpose()).determinant() < 0.0 ? -1.0 : 1.0;
  Eigen::Matrix3d D = Eigen::Matrix3d::Identity();
  D(2, 2) = d;

  RigidTransform out;
  out.rotation = V * D * U.transpose();

  // Step 7: translation
  out.translation = tgt_centroid - out.rotation * src_centroid;
  return out;
}

double rmsError(const std::vector<PointCorrespondence>& pairs,
                const RigidTransform& transform) {
  if (pairs.empty()) return 0.0;

  double sum_sq = 0.0;
  for (const auto& pair : pairs) {
    sum_sq += (transform.apply(pair.source) - pair.target).squaredNorm();
  }
  return std::sqrt(sum_sq / static_cast<double>(pairs.size()));
}

}  // namespace meshtools
