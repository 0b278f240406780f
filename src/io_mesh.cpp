// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * io_mesh.cpp
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "meshtools/io/mesh_io.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <nanopcl/io/pcd_io.hpp>
#include <open3d/io/PointCloudIO.h>
#include <open3d/io/TriangleMeshIO.h>
#include <sstream>
#include <vector>

#include "meshtools/io/cloud_convert.hpp"
#include "meshtools/io/open3d_convert.hpp"

namespace meshtools {
namespace io {

namespace {

std::string toLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

/// Strip '#' comments and surrounding whitespace.
std::string dataPart(std::string line) {
  const auto hash = line.find('#');
  if (hash != std::string::npos) line.erase(hash);
  const auto first = line.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) return {};
  const auto last = line.find_last_not_of(" \t\r\n");
  return line.substr(first, last - first + 1);
}

std::vector<std::string> tokenize(const std::string& line) {
  std::istringstream ss(line);
  return {std::istream_iterator<std::string>(ss),
          std::istream_iterator<std::string>()};
}

/// Element count in [0, INT_MAX].
long long parseCount(const std::string& token, const std::string& path) {
  const char* begin = token.c_str();
  char* end = nullptr;
  errno = 0;
  const long long value = std::strtoll(begin, &end, 10);
  if (end == begin || *end != '\0' || errno == ERANGE || value < 0 ||
      value > INT_MAX) {
    throw MeshIOError(path + ": invalid OFF element count '" + token + "'");
  }
  return value;
}

bool isAssimpFormat(MeshFormat format) {
  return format == MeshFormat::OBJ || format == MeshFormat::STL ||
         format == MeshFormat::GLTF;
}

// ─── Readers ────────────────────────────────────────────────────────────────

TriangleMesh readTriangleMesh(const std::string& path, MeshFormat format) {
  open3d::geometry::TriangleMesh o3d;
  open3d::io::ReadTriangleMeshOptions params;
  params.enable_post_processing = false;
  params.print_progress = false;
  if (!open3d::io::ReadTriangleMesh(path, o3d, params)) {
    throw MeshIOError("Failed to load " + path);
  }
  if (o3d.vertices_.empty()) {
    throw MeshIOError("Failed to load " + path + ": no vertices");
  }

  // The scene importers emit one vertex per face corner
  if (isAssimpFormat(format)) {
    o3d.RemoveDuplicatedVertices();
    if (format == MeshFormat::STL) o3d.vertex_normals_.clear();
  }
  return fromOpen3DMesh(o3d);
}

TriangleMesh readPointCloud(const std::string& path) {
  open3d::geometry::PointCloud cloud;
  if (!open3d::io::ReadPointCloud(path, cloud) || cloud.points_.empty()) {
    throw MeshIOError("Failed to load " + path);
  }
  return fromOpen3DCloud(cloud);
}

// ─── Writers ────────────────────────────────────────────────────────────────

TriangleMesh withSavedChannels(const TriangleMesh& mesh,
                               const SaveOptions& options) {
  TriangleMesh copy = mesh;
  if (!options.save_normals) copy.normals.clear();
  if (!options.save_vertex_color) copy.colors.clear();
  return copy;
}

bool writePointCloud(const std::string& path, const TriangleMesh& mesh,
                     const SaveOptions& options) {
  using Option = open3d::io::WritePointCloudOption;
  const Option params(options.binary ? Option::IsAscii::Binary
                                     : Option::IsAscii::Ascii);
  return open3d::io::WritePointCloud(
      path, toOpen3DCloud(withSavedChannels(mesh, options)), params);
}

bool writeTriangleMesh(const std::string& path, const TriangleMesh& mesh,
                       MeshFormat format, const SaveOptions& options) {
  auto o3d = toOpen3DMesh(withSavedChannels(mesh, options));

  // Open3D writes STL as binary only, with facet normals
  bool ascii = !options.binary;
  if (format == MeshFormat::STL) {
    o3d.ComputeTriangleNormals();
    ascii = false;
  }

  return open3d::io::WriteTriangleMesh(
      path, o3d, ascii, /*compressed=*/false,
      /*write_vertex_normals=*/o3d.HasVertexNormals(),
      /*write_vertex_colors=*/o3d.HasVertexColors(),
      /*write_triangle_uvs=*/false, /*print_progress=*/false);
}

}  // namespace

// ─── Format dispatch ────────────────────────────────────────────────────────

std::string extensionOf(const std::string& path) {
  return toLower(std::filesystem::path(path).extension().string());
}

MeshFormat formatFromPath(const std::string& path) {
  const auto ext = extensionOf(path);
  if (ext == ".ply") return MeshFormat::PLY;
  if (ext == ".obj") return MeshFormat::OBJ;
  if (ext == ".stl") return MeshFormat::STL;
  if (ext == ".off") return MeshFormat::OFF;
  if (ext == ".gltf" || ext == ".glb") return MeshFormat::GLTF;
  if (ext == ".xyz" || ext == ".pts") return MeshFormat::XYZ;
  if (ext == ".pcd") return MeshFormat::PCD;
  return MeshFormat::Unknown;
}

bool canRead(const std::string& path) {
  return formatFromPath(path) != MeshFormat::Unknown;
}

bool canWrite(const std::string& path) {
  return formatFromPath(path) != MeshFormat::Unknown;
}

void validateOffHeader(const std::string& path) {
  std::ifstream ifs(path);
  if (!ifs) throw MeshIOError("Cannot open " + path);

  std::string line;
  std::string header;
  while (header.empty() && std::getline(ifs, line)) header = dataPart(line);

  auto tokens = tokenize(header);
  if (tokens.empty() || tokens[0].size() < 3 ||
      tokens[0].compare(tokens[0].size() - 3, 3, "OFF") != 0) {
    throw MeshIOError(path + ": missing OFF keyword");
  }
  tokens.erase(tokens.begin());

  // Counts may follow the keyword or sit on the next data line
  while (tokens.empty() && std::getline(ifs, line)) {
    tokens = tokenize(dataPart(line));
  }
  if (tokens.size() < 2) {
    throw MeshIOError(path + ": missing OFF vertex / face counts");
  }
  const long long num_vertices = parseCount(tokens[0], path);
  const long long num_faces = parseCount(tokens[1], path);

  long long data_lines = 0;
  while (std::getline(ifs, line)) {
    if (!dataPart(line).empty()) ++data_lines;
  }
  if (num_vertices > data_lines || num_faces > data_lines - num_vertices) {
    throw MeshIOError(path + ": OFF header declares " +
                      std::to_string(num_vertices) + " vertices and " +
                      std::to_string(num_faces) + " faces but the file has " +
                      std::to_string(data_lines) + " data lines");
  }
}

TriangleMesh loadMesh(const std::string& path) {
  const auto format = formatFromPath(path);
  if (format == MeshFormat::Unknown) {
    throw MeshIOError("Unsupported mesh format '" + extensionOf(path) +
                      "': " + path);
  }
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    throw MeshIOError("Cannot open " + path);
  }
  routeOpen3DLogging();
  if (format == MeshFormat::OFF) validateOffHeader(path);

  TriangleMesh mesh;
  try {
    switch (format) {
      case MeshFormat::PCD:
        mesh = fromPointCloud(nanopcl::io::loadPCD(path));
        break;
      case MeshFormat::XYZ:
        mesh = readPointCloud(path);
        break;
      default:
        mesh = readTriangleMesh(path, format);
        break;
    }
  } catch (const MeshIOError&) {
    throw;
  } catch (const std::exception& e) {
    throw MeshIOError("Failed to load " + path + ": " + e.what());
  }

  mesh.name = std::filesystem::path(path).stem().string();
  spdlog::debug("[mesh_io] Loaded {} ({} vertices, {} faces)", path,
                mesh.vertexCount(), mesh.faceCount());
  return mesh;
}

void saveMesh(const std::string& path, const TriangleMesh& mesh,
              const SaveOptions& options) {
  const auto format = formatFromPath(path);
  if (format == MeshFormat::Unknown) {
    throw MeshIOError("Unsupported mesh format '" + extensionOf(path) +
                      "': " + path);
  }
  if (mesh.empty()) throw MeshIOError("Refusing to save empty mesh: " + path);
  routeOpen3DLogging();

  if (options.save_face_color && mesh.hasFaceColors()) {
    spdlog::debug("[mesh_io] Face colors are not written to {}", path);
  }

  bool written = false;
  try {
    switch (format) {
      case MeshFormat::PCD:
        nanopcl::io::savePCD(path, toPointCloud(withSavedChannels(mesh, options)),
                             options.binary ? nanopcl::io::PCDFormat::BINARY
                                            : nanopcl::io::PCDFormat::ASCII);
        written = true;
        break;
      case MeshFormat::XYZ:
        written = writePointCloud(path, mesh, options);
        break;
      case MeshFormat::PLY:
        written = mesh.isPointCloud()
                      ? writePointCloud(path, mesh, options)
                      : writeTriangleMesh(path, mesh, format, options);
        break;
      default:
        written = writeTriangleMesh(path, mesh, format, options);
        break;
    }
  } catch (const std::exception& e) {
    throw MeshIOError("Failed to save " + path + ": " + e.what());
  }

  if (!written) throw MeshIOError("Failed to save " + path);
  spdlog::debug("[mesh_io] Saved {} ({} vertices, {} faces)", path,
                mesh.vertexCount(), mesh.faceCount());
}

}  // namespace io
}  // namespace meshtools
