// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "meshtools/mesh.hpp"

namespace meshtools {

BoundingBox TriangleMesh::boundingBox() const {
  BoundingBox bbox;
  for (const auto& v : vertices) bbox.extend(v);
  return bbox;
}

void TriangleMesh::transform(const Eigen::Isometry3d& T) {
  for (auto& v : vertices) v = T * v;

  if (hasNormals()) {
    const Eigen::Matrix3d R = T.linear();
    for (auto& n : normals) n = R * n;
  }
}

void TriangleMesh::dropMismatchedChannels() {
  if (!normals.empty() && normals.size() != vertices.size()) normals.clear();
  if (!colors.empty() && colors.size() != vertices.size()) colors.clear();
  if (!face_colors.empty() && face_colors.size() != faces.size())
    face_colors.clear();
}

}  // namespace meshtools
