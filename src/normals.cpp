// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * normals.cpp
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "meshtools/processing/normals.hpp"

#include <spdlog/spdlog.h>

#include <nanopcl/geometry/normal_estimation.hpp>

#include "meshtools/io/cloud_convert.hpp"
#include "meshtools/io/open3d_convert.hpp"
#include "meshtools/processing/cleaning.hpp"

namespace meshtools {
namespace processing {

namespace {

double faceVolume(const TriangleMesh& mesh, const Face& f) {
  const auto& a = mesh.vertices[f[0]];
  const auto& b = mesh.vertices[f[1]];
  const auto& c = mesh.vertices[f[2]];
  return a.dot(b.cross(c)) / 6.0;
}

/// Same vertex cycle, i.e. same winding.
bool sameWinding(const Face& a, const Face& b) {
  return b == a || b == Face(a[1], a[2], a[0]) || b == Face(a[2], a[0], a[1]);
}

}  // namespace

double signedVolume(const TriangleMesh& mesh) {
  double volume = 0.0;
  for (const auto& f : mesh.faces) volume += faceVolume(mesh, f);
  return volume;
}

size_t orientFaces(TriangleMesh& mesh, bool make_outward) {
  if (mesh.isPointCloud()) return 0;
  const auto original = mesh.faces;

  // OrientTriangles may stop half way on failure: work on a copy
  auto o3d = toOpen3DMesh(mesh);
  if (o3d.OrientTriangles()) {
    mesh.faces.assign(o3d.triangles_.begin(), o3d.triangles_.end());
  } else {
    spdlog::warn("[normals] Mesh is not orientable, face winding kept");
  }

  if (make_outward) {
    int num_components = 0;
    const auto labels = labelFaceComponents(mesh, num_components);
    std::vector<double> volume(num_components, 0.0);
    for (size_t i = 0; i < mesh.faceCount(); ++i) {
      volume[labels[i]] += faceVolume(mesh, mesh.faces[i]);
    }
    for (size_t i = 0; i < mesh.faceCount(); ++i) {
      if (volume[labels[i]] < 0.0) std::swap(mesh.faces[i][1], mesh.faces[i][2]);
    }
  }

  size_t flipped = 0;
  for (size_t i = 0; i < mesh.faceCount(); ++i) {
    if (!sameWinding(original[i], mesh.faces[i])) ++flipped;
  }
  return flipped;
}

void computeVertexNormals(TriangleMesh& mesh) {
  auto o3d = toOpen3DMesh(mesh);
  o3d.vertex_normals_.clear();
  o3d.ComputeVertexNormals(/*normalized=*/true);
  mesh.normals = o3d.vertex_normals_;
}

void estimatePointNormals(TriangleMesh& mesh, int k) {
  if (mesh.empty()) return;

  Eigen::Vector3d centroid = Eigen::Vector3d::Zero();
  for (const auto& v : mesh.vertices) centroid += v;
  centroid /= static_cast<double>(mesh.vertexCount());

  TriangleMesh positions;
  positions.vertices = mesh.vertices;
  auto cloud = toPointCloud(positions);

  // Oriented toward the centroid, then reversed
  nanopcl::geometry::estimateNormals(cloud, k, centroid.cast<float>());

  mesh.normals.resize(mesh.vertexCount());
  for (size_t i = 0; i < mesh.vertexCount(); ++i) {
    mesh.normals[i] = -cloud.normal(i).cast<double>();
  }
}

}  // namespace processing
}  // namespace meshtools
