// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * mesh_io.hpp
 *
 * Mesh file reading / writing. Format is chosen from the file extension.
 *
 * Supported:
 *   .ply .obj .stl .off .gltf .glb   Open3D triangle-mesh I/O
 *   .xyz .pts                        Open3D point-cloud I/O (faces dropped)
 *   .pcd                             nanoPCL
 *
 * OBJ, STL and glTF are welded on load (coincident corners merged). Face
 * colors are not written: Open3D files carry per-vertex channels only.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef MESHTOOLS_IO_MESH_IO_HPP
#define MESHTOOLS_IO_MESH_IO_HPP

#include <stdexcept>
#include <string>

#include "meshtools/io/save_options.hpp"
#include "meshtools/mesh.hpp"

namespace meshtools {
namespace io {

/// File could not be opened, parsed or written.
class MeshIOError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

enum class MeshFormat { PLY, OBJ, STL, OFF, GLTF, XYZ, PCD, Unknown };

/// Format from extension (case-insensitive); Unknown if unsupported.
MeshFormat formatFromPath(const std::string& path);

/// Lower-cased extension including the dot ("" if none).
std::string extensionOf(const std::string& path);

bool canRead(const std::string& path);
bool canWrite(const std::string& path);

/// @throws MeshIOError
TriangleMesh loadMesh(const std::string& path);

/// @throws MeshIOError
void saveMesh(const std::string& path, const TriangleMesh& mesh,
              const SaveOptions& options = {});

/**
 * @brief Checks the OFF header counts against the file body.
 *
 * Counts must be non-negative integers no larger than INT_MAX, and the
 * declared vertices and faces must fit in the remaining data lines.
 * loadMesh runs this before handing an .off file to the reader.
 *
 * @throws MeshIOError
 */
void validateOffHeader(const std::string& path);

}  // namespace io
}  // namespace meshtools

#endif  // MESHTOOLS_IO_MESH_IO_HPP
