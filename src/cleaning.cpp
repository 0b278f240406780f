// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * cleaning.cpp
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "meshtools/processing/cleaning.hpp"

#include <tuple>

#include "meshtools/io/open3d_convert.hpp"

namespace meshtools {
namespace processing {

namespace {

/**
 * Face colors of the faces left by an order-preserving removal. Survivors
 * are an in-order subsequence of the original faces with unchanged indices.
 */
std::vector<Color> survivingFaceColors(
    const std::vector<Face>& before, const std::vector<Color>& colors,
    const std::vector<Eigen::Vector3i>& after) {
  std::vector<Color> kept;
  kept.reserve(after.size());
  size_t j = 0;
  for (size_t i = 0; i < before.size() && j < after.size(); ++i) {
    if (before[i] == after[j]) {
      kept.push_back(colors[i]);
      ++j;
    }
  }
  return kept;
}

/// Run an Open3D step that only removes triangles. Vertices are untouched.
template <typename Step>
size_t dropFaces(TriangleMesh& mesh, Step step) {
  auto o3d = toOpen3DMesh(mesh);
  step(o3d);

  const size_t removed = mesh.faceCount() - o3d.triangles_.size();
  if (removed == 0) return 0;

  if (mesh.hasFaceColors()) {
    mesh.face_colors =
        survivingFaceColors(mesh.faces, mesh.face_colors, o3d.triangles_);
  } else {
    mesh.face_colors.clear();
  }
  mesh.faces.assign(o3d.triangles_.begin(), o3d.triangles_.end());
  return removed;
}

}  // namespace

size_t removeDuplicateFaces(TriangleMesh& mesh) {
  return dropFaces(mesh, [](open3d::geometry::TriangleMesh& m) {
    m.RemoveDuplicatedTriangles();
  });
}

size_t removeDegenerateFaces(TriangleMesh& mesh) {
  return dropFaces(mesh, [](open3d::geometry::TriangleMesh& m) {
    m.RemoveDegenerateTriangles();
  });
}

size_t removeUnreferencedVertices(TriangleMesh& mesh) {
  if (mesh.isPointCloud()) return 0;

  auto o3d = toOpen3DMesh(mesh);
  o3d.RemoveUnreferencedVertices();

  const size_t removed = mesh.vertexCount() - o3d.vertices_.size();
  if (removed > 0) assignGeometry(mesh, o3d);
  return removed;
}

size_t removeDuplicateVertices(TriangleMesh& mesh) {
  const size_t before = mesh.vertexCount();
  if (before == 0) return 0;
  const bool had_faces = !mesh.isPointCloud();

  // Face count and order are unchanged here, so face colors stay aligned
  auto o3d = toOpen3DMesh(mesh);
  o3d.RemoveDuplicatedVertices();
  if (o3d.vertices_.size() != before) {
    assignGeometry(mesh, o3d);
    removeDegenerateFaces(mesh);
  }

  if (had_faces) removeUnreferencedVertices(mesh);
  return before - mesh.vertexCount();
}

std::vector<int> labelFaceComponents(const TriangleMesh& mesh,
                                     int& num_components) {
  auto o3d = toOpen3DMesh(mesh);
  std::vector<int> labels;
  std::vector<size_t> sizes;
  std::vector<double> areas;
  std::tie(labels, sizes, areas) = o3d.ClusterConnectedTriangles();
  num_components = static_cast<int>(sizes.size());
  return labels;
}

size_t removeSmallComponents(TriangleMesh& mesh, int min_faces) {
  if (mesh.isPointCloud()) return 0;

  auto o3d = toOpen3DMesh(mesh);
  std::vector<int> labels;
  std::vector<size_t> sizes;
  std::vector<double> areas;
  std::tie(labels, sizes, areas) = o3d.ClusterConnectedTriangles();

  std::vector<bool> remove(mesh.faceCount(), false);
  size_t removed = 0;
  for (size_t i = 0; i < labels.size(); ++i) {
    if (sizes[labels[i]] < static_cast<size_t>(min_faces)) {
      remove[i] = true;
      ++removed;
    }
  }
  if (removed == 0) return 0;

  std::vector<Color> face_colors;
  if (mesh.hasFaceColors()) {
    for (size_t i = 0; i < remove.size(); ++i) {
      if (!remove[i]) face_colors.push_back(mesh.face_colors[i]);
    }
  }

  // Every face may go: the mesh then ends up empty, not a point cloud
  o3d.RemoveTrianglesByMask(remove);
  o3d.RemoveUnreferencedVertices();
  assignGeometry(mesh, o3d);
  mesh.face_colors = std::move(face_colors);
  return removed;
}

}  // namespace processing
}  // namespace meshtools
