// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "meshtools/io/cloud_convert.hpp"

namespace meshtools {

PointCloud toPointCloud(const TriangleMesh& mesh,
                        const std::vector<size_t>& indices) {
  PointCloud cloud;
  cloud.reserve(indices.size());
  for (size_t idx : indices) {
    const Eigen::Vector3f p = mesh.vertices[idx].cast<float>();
    cloud.add(p.x(), p.y(), p.z());
  }

  if (mesh.hasNormals()) {
    cloud.useNormal();
    for (size_t i = 0; i < indices.size(); ++i) {
      cloud.normal(i) = mesh.normals[indices[i]].cast<float>();
    }
  }
  if (mesh.hasColors()) {
    cloud.useColor();
    for (size_t i = 0; i < indices.size(); ++i) {
      const auto& c = mesh.colors[indices[i]];
      cloud.color(i) = nanopcl::Color(c.r, c.g, c.b);
    }
  }
  return cloud;
}

PointCloud toPointCloud(const TriangleMesh& mesh) {
  std::vector<size_t> indices(mesh.vertexCount());
  for (size_t i = 0; i < indices.size(); ++i) indices[i] = i;
  return toPointCloud(mesh, indices);
}

TriangleMesh fromPointCloud(const PointCloud& cloud) {
  TriangleMesh mesh;
  mesh.vertices.reserve(cloud.size());
  for (size_t i : cloud.indices()) {
    mesh.vertices.emplace_back(cloud.point(i).cast<double>());
  }

  if (cloud.hasNormal()) {
    mesh.normals.reserve(cloud.size());
    for (size_t i : cloud.indices()) {
      mesh.normals.emplace_back(cloud.normal(i).cast<double>());
    }
  }
  if (cloud.hasColor()) {
    mesh.colors.reserve(cloud.size());
    for (size_t i : cloud.indices()) {
      const auto& c = cloud.color(i);
      mesh.colors.push_back(Color{c.r, c.g, c.b, 255});
    }
  }
  return mesh;
}

}  // namespace meshtools
