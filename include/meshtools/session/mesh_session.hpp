// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * mesh_session.hpp
 *
 * A set of loaded meshes bound to one engine, with a "current" mesh that
 * operations act on by default.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef MESHTOOLS_SESSION_MESH_SESSION_HPP
#define MESHTOOLS_SESSION_MESH_SESSION_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "meshtools/engine/mesh_engine.hpp"

namespace meshtools {

/// Summary statistics of one mesh.
struct MeshInfo {
  int mesh_id = -1;
  std::string name;
  size_t vertex_count = 0;
  size_t face_count = 0;
  BoundingBox bounding_box;
};

/**
 * @brief Single-owner collection of meshes processed by one engine.
 *
 * Ids are assigned in insertion order (0, 1, 2, ...) and never reused or
 * renumbered. Not thread-safe.
 */
class MeshSession {
 public:
  /// @throws std::invalid_argument if engine is null
  explicit MeshSession(MeshEngine::Ptr engine);

  const MeshEngine& engine() const { return *engine_; }
  MeshEngine& engine() { return *engine_; }

  // ─── Loading / saving ───────────────────────────────────────────────────

  /// Load a file; the new mesh becomes current. @throws io::MeshIOError
  int loadMesh(const std::string& path);

  /// Take ownership of an in-memory mesh; it becomes current.
  int addMesh(TriangleMesh mesh);

  /**
   * @brief Save a mesh, creating parent directories as needed.
   *
   * @param mesh_id Mesh to save (made current); current mesh if nullopt
   * @throws io::MeshIOError, std::out_of_range
   */
  void saveMesh(const std::string& path, std::optional<int> mesh_id = {},
                const SaveOptions& options = {});

  // ─── Mesh management ────────────────────────────────────────────────────

  /// @throws std::out_of_range for an unknown id
  void setActiveMesh(int mesh_id);

  /// @throws std::out_of_range for an unknown id
  void deleteMesh(int mesh_id);

  size_t meshCount() const { return meshes_.size(); }
  bool hasMesh(int mesh_id) const { return meshes_.count(mesh_id) > 0; }

  /// Current mesh id (nullopt when the session is empty)
  std::optional<int> currentMeshId() const { return current_; }

  /// Ids in ascending order
  std::vector<int> meshIds() const;

  /// @throws std::out_of_range
  TriangleMesh& mesh(int mesh_id);
  const TriangleMesh& mesh(int mesh_id) const;

  /// @throws std::runtime_error if no mesh is loaded
  TriangleMesh& currentMesh();
  const TriangleMesh& currentMesh() const;

  /// Select mesh_id (if given) and return the current mesh
  TriangleMesh& select(std::optional<int> mesh_id);

  // ─── Queries ────────────────────────────────────────────────────────────

  /// Info of mesh_id (made current) or of the current mesh
  MeshInfo meshInfo(std::optional<int> mesh_id = {});

  /// Info of every mesh; the current mesh is left unchanged
  std::vector<MeshInfo> listMeshes();

 private:
  MeshEngine::Ptr engine_;
  std::map<int, TriangleMesh> meshes_;
  std::optional<int> current_;
  int next_id_ = 0;
};

}  // namespace meshtools

#endif  // MESHTOOLS_SESSION_MESH_SESSION_HPP
