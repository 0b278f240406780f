// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * mesh_fixtures.hpp
 *
 * Synthetic meshes and temp-dir helpers shared by the unit tests.
 */

#ifndef MESHTOOLS_TESTS_MESH_FIXTURES_HPP
#define MESHTOOLS_TESTS_MESH_FIXTURES_HPP

#include <cmath>
#include <filesystem>
#include <string>

#include "meshtools/mesh.hpp"

namespace meshtools {
namespace test {

/// Axis-aligned cube, 8 vertices, 12 outward-facing triangles.
inline TriangleMesh makeCube(double size = 1.0,
                             const Eigen::Vector3d& center = Eigen::Vector3d::Zero()) {
  const double h = 0.5 * size;
  TriangleMesh mesh;
  mesh.name = "cube";
  mesh.vertices = {center + Eigen::Vector3d(-h, -h, -h),
                   center + Eigen::Vector3d(h, -h, -h),
                   center + Eigen::Vector3d(h, h, -h),
                   center + Eigen::Vector3d(-h, h, -h),
                   center + Eigen::Vector3d(-h, -h, h),
                   center + Eigen::Vector3d(h, -h, h),
                   center + Eigen::Vector3d(h, h, h),
                   center + Eigen::Vector3d(-h, h, h)};
  mesh.faces = {Face(0, 2, 1), Face(0, 3, 2),   // bottom
                Face(4, 5, 6), Face(4, 6, 7),   // top
                Face(0, 1, 5), Face(0, 5, 4),   // front
                Face(3, 7, 6), Face(3, 6, 2),   // back
                Face(0, 4, 7), Face(0, 7, 3),   // left
                Face(1, 2, 6), Face(1, 6, 5)};  // right
  return mesh;
}

/// Cube without its top (two faces), leaving one square hole.
inline TriangleMesh makeOpenBox(double size = 1.0) {
  auto mesh = makeCube(size);
  mesh.name = "open_box";
  mesh.faces.erase(mesh.faces.begin() + 2, mesh.faces.begin() + 4);
  return mesh;
}

/// Triangulated height field z = f(x, y) on [-1, 1]², n × n vertices.
/// The surface has no symmetry, so rigid registration is well posed.
inline TriangleMesh makeWavySurface(int n = 40) {
  TriangleMesh mesh;
  mesh.name = "wavy";
  for (int i = 0; i < n; ++i) {
    for (int j = 0; j < n; ++j) {
      const double x = -1.0 + 2.0 * i / (n - 1);
      const double y = -1.0 + 2.0 * j / (n - 1);
      const double z = 0.3 * std::sin(2.0 * x) * std::cos(1.5 * y) +
                       0.2 * x * y + 0.1 * x * x;
      mesh.vertices.emplace_back(x, y, z);
    }
  }
  for (int i = 0; i + 1 < n; ++i) {
    for (int j = 0; j + 1 < n; ++j) {
      const int a = i * n + j;
      const int b = (i + 1) * n + j;
      mesh.faces.emplace_back(a, b, b + 1);
      mesh.faces.emplace_back(a, b + 1, a + 1);
    }
  }
  return mesh;
}

/// Fibonacci-sphere point cloud (no faces).
inline TriangleMesh makeSpherePoints(int count = 600, double radius = 1.0) {
  TriangleMesh mesh;
  mesh.name = "sphere_points";
  const double golden = M_PI * (3.0 - std::sqrt(5.0));
  for (int i = 0; i < count; ++i) {
    const double y = 1.0 - 2.0 * (i + 0.5) / count;
    const double r = std::sqrt(1.0 - y * y);
    const double theta = golden * i;
    mesh.vertices.emplace_back(radius * r * std::cos(theta), radius * y,
                               radius * r * std::sin(theta));
  }
  return mesh;
}

/// Small rigid motion used by the registration tests.
inline Eigen::Isometry3d smallMotion() {
  Eigen::Isometry3d T = Eigen::Isometry3d::Identity();
  T.rotate(Eigen::AngleAxisd(3.0 * M_PI / 180.0,
                             Eigen::Vector3d(1.0, 2.0, 3.0).normalized()));
  T.pretranslate(Eigen::Vector3d(0.03, -0.02, 0.01));
  return T;
}

/// Fresh, empty directory under the system temp dir.
inline std::filesystem::path makeTempDir(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / ("meshtools_" + name);
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

}  // namespace test
}  // namespace meshtools

#endif  // MESHTOOLS_TESTS_MESH_FIXTURES_HPP
