// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * mesh.hpp
 *
 * Indexed triangle mesh (or point cloud when it has no faces).
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef MESHTOOLS_MESH_HPP
#define MESHTOOLS_MESH_HPP

#include <Eigen/Geometry>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace meshtools {

/// 8-bit RGBA color.
struct Color {
  uint8_t r = 255;
  uint8_t g = 255;
  uint8_t b = 255;
  uint8_t a = 255;

  bool operator==(const Color& o) const {
    return r == o.r && g == o.g && b == o.b && a == o.a;
  }
};

/// Axis-aligned bounding box.
struct BoundingBox {
  Eigen::Vector3d min = Eigen::Vector3d::Constant(
      std::numeric_limits<double>::max());
  Eigen::Vector3d max = Eigen::Vector3d::Constant(
      std::numeric_limits<double>::lowest());

  bool isValid() const { return (min.array() <= max.array()).all(); }

  void extend(const Eigen::Vector3d& p) {
    min = min.cwiseMin(p);
    max = max.cwiseMax(p);
  }

  /// Diagonal length (0 for an empty box)
  double diagonal() const { return isValid() ? (max - min).norm() : 0.0; }

  Eigen::Vector3d center() const { return 0.5 * (min + max); }
};

/// Triangle as three vertex indices, counter-clockwise = front face.
using Face = Eigen::Vector3i;

/**
 * @brief Indexed triangle mesh with optional per-vertex / per-face channels.
 *
 * Optional channels are either empty or sized to match their element
 * (normals/colors ↔ vertices, face_colors ↔ faces). A mesh without faces is
 * treated as a point cloud.
 */
struct TriangleMesh {
  std::string name;

  std::vector<Eigen::Vector3d> vertices;
  std::vector<Face> faces;

  std::vector<Eigen::Vector3d> normals;  ///< Per-vertex (optional)
  std::vector<Color> colors;             ///< Per-vertex (optional)
  std::vector<Color> face_colors;        ///< Per-face (optional)

  size_t vertexCount() const { return vertices.size(); }
  size_t faceCount() const { return faces.size(); }
  bool empty() const { return vertices.empty(); }
  bool isPointCloud() const { return faces.empty(); }

  bool hasNormals() const {
    return !normals.empty() && normals.size() == vertices.size();
  }
  bool hasColors() const {
    return !colors.empty() && colors.size() == vertices.size();
  }
  bool hasFaceColors() const {
    return !face_colors.empty() && face_colors.size() == faces.size();
  }

  BoundingBox boundingBox() const;

  /// Move vertices by T and rotate normals accordingly
  void transform(const Eigen::Isometry3d& T);

  /// Drop optional channels whose size no longer matches
  void dropMismatchedChannels();
};

}  // namespace meshtools

#endif  // MESHTOOLS_MESH_HPP
