// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "meshtools/io/open3d_convert.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <mutex>
#include <open3d/utility/Logging.h>
#include <stdexcept>
#include <string>

namespace meshtools {

namespace {

Eigen::Vector3d toUnitRgb(const Color& c) {
  return Eigen::Vector3d(c.r, c.g, c.b) / 255.0;
}

Color fromUnitRgb(const Eigen::Vector3d& rgb) {
  auto byte = [](double v) {
    return static_cast<uint8_t>(std::lround(std::clamp(v, 0.0, 1.0) * 255.0));
  };
  return Color{byte(rgb.x()), byte(rgb.y()), byte(rgb.z()), 255};
}

}  // namespace

open3d::geometry::TriangleMesh toOpen3DMesh(const TriangleMesh& mesh) {
  open3d::geometry::TriangleMesh out;
  out.vertices_ = mesh.vertices;
  out.triangles_.assign(mesh.faces.begin(), mesh.faces.end());
  if (mesh.hasNormals()) out.vertex_normals_ = mesh.normals;
  if (mesh.hasColors()) {
    out.vertex_colors_.reserve(mesh.vertexCount());
    for (const auto& c : mesh.colors) out.vertex_colors_.push_back(toUnitRgb(c));
  }
  return out;
}

open3d::geometry::PointCloud toOpen3DCloud(const TriangleMesh& mesh) {
  open3d::geometry::PointCloud out;
  out.points_ = mesh.vertices;
  if (mesh.hasNormals()) out.normals_ = mesh.normals;
  if (mesh.hasColors()) {
    out.colors_.reserve(mesh.vertexCount());
    for (const auto& c : mesh.colors) out.colors_.push_back(toUnitRgb(c));
  }
  return out;
}

TriangleMesh fromOpen3DMesh(const open3d::geometry::TriangleMesh& mesh) {
  TriangleMesh out;
  out.vertices = mesh.vertices_;

  const int n = static_cast<int>(mesh.vertices_.size());
  out.faces.reserve(mesh.triangles_.size());
  for (const auto& t : mesh.triangles_) {
    if ((t.array() < 0).any() || (t.array() >= n).any()) {
      throw std::out_of_range("triangle (" + std::to_string(t[0]) + ", " +
                              std::to_string(t[1]) + ", " +
                              std::to_string(t[2]) + ") references a vertex "
                              "outside 0.." + std::to_string(n - 1));
    }
    out.faces.push_back(t);
  }

  if (mesh.HasVertexNormals()) out.normals = mesh.vertex_normals_;
  if (mesh.HasVertexColors()) {
    out.colors.reserve(mesh.vertex_colors_.size());
    for (const auto& c : mesh.vertex_colors_) out.colors.push_back(fromUnitRgb(c));
  }
  return out;
}

TriangleMesh fromOpen3DCloud(const open3d::geometry::PointCloud& cloud) {
  TriangleMesh out;
  out.vertices = cloud.points_;
  if (cloud.HasNormals()) out.normals = cloud.normals_;
  if (cloud.HasColors()) {
    out.colors.reserve(cloud.colors_.size());
    for (const auto& c : cloud.colors_) out.colors.push_back(fromUnitRgb(c));
  }
  return out;
}

void assignGeometry(TriangleMesh& mesh,
                    const open3d::geometry::TriangleMesh& result) {
  auto converted = fromOpen3DMesh(result);
  converted.name = std::move(mesh.name);
  if (converted.faceCount() == mesh.faceCount()) {
    converted.face_colors = std::move(mesh.face_colors);
  }
  mesh = std::move(converted);
}

void routeOpen3DLogging() {
  static std::once_flag once;
  std::call_once(once, [] {
    // stdout is reserved for the tool-server protocol
    open3d::utility::SetVerbosityLevel(open3d::utility::VerbosityLevel::Warning);
    open3d::utility::Logger::GetInstance().SetPrintFunction(
        [](const std::string& message) {
          auto end = message.find_last_not_of("\r\n");
          spdlog::debug("[Open3D] {}", message.substr(0, end + 1));
        });
  });
}

}  // namespace meshtools
