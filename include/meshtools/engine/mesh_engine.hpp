// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * mesh_engine.hpp
 *
 * Mesh processing backend interface. Sessions, alignment, repair and batch
 * runs only talk to the engine through this interface.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef MESHTOOLS_ENGINE_MESH_ENGINE_HPP
#define MESHTOOLS_ENGINE_MESH_ENGINE_HPP

#include <Eigen/Geometry>
#include <memory>
#include <string>

#include "meshtools/config/engine.hpp"
#include "meshtools/io/save_options.hpp"
#include "meshtools/mesh.hpp"

namespace meshtools {

/// Point-to-point ICP request with an absolute correspondence gate.
struct IcpSettings {
  int sample_number = 2000;  ///< Source vertices used (all if fewer)
  int max_iterations = 75;
  double max_correspondence_distance = 0.0;  ///< Same units as the meshes
};

/// Outcome of a pairwise registration (source → target).
struct RegistrationReport {
  Eigen::Isometry3d transform = Eigen::Isometry3d::Identity();
  size_t iterations = 0;
  size_t correspondences = 0;  ///< Inlier pairs at the final iteration
  double rmse = 0.0;           ///< RMS distance of inlier pairs
  double fitness = 0.0;        ///< Inlier ratio of the sampled source
  bool converged = false;
};

/**
 * @brief Abstract mesh processing engine.
 *
 * All operations act on the mesh passed in; the engine holds no mesh state.
 */
class MeshEngine {
 public:
  using Ptr = std::shared_ptr<MeshEngine>;

  virtual ~MeshEngine() = default;

  /// Engine name reported to clients (e.g. "builtin")
  virtual std::string name() const = 0;

  // ─── I/O ────────────────────────────────────────────────────────────────

  virtual bool canRead(const std::string& path) const = 0;

  /// @throws io::MeshIOError
  virtual TriangleMesh load(const std::string& path) const = 0;

  /// @throws io::MeshIOError
  virtual void save(const TriangleMesh& mesh, const std::string& path,
                    const SaveOptions& options) const = 0;

  // ─── Cleaning ───────────────────────────────────────────────────────────

  /// @return Faces removed
  virtual size_t removeDuplicateFaces(TriangleMesh& mesh) const = 0;

  /// @return Vertices removed (merged or unreferenced)
  virtual size_t removeDuplicateVertices(TriangleMesh& mesh) const = 0;

  /// @return Faces removed
  virtual size_t removeSmallComponents(TriangleMesh& mesh,
                                       int min_component_size) const = 0;

  /// @return Holes closed
  virtual size_t closeHoles(TriangleMesh& mesh, int max_hole_size,
                            bool self_intersection_guard) const = 0;

  // ─── Normals ────────────────────────────────────────────────────────────

  /// Coherent face winding (outward when make_outward). @return Faces flipped
  virtual size_t reorientFaces(TriangleMesh& mesh, bool make_outward) const = 0;

  virtual void computeVertexNormals(TriangleMesh& mesh) const = 0;

  virtual void computePointCloudNormals(TriangleMesh& mesh) const = 0;

  // ─── Registration ───────────────────────────────────────────────────────

  /**
   * @brief Rigid ICP registration of source onto target.
   *
   * Neither mesh is modified; apply report.transform to move the source.
   */
  virtual RegistrationReport registerIcp(const TriangleMesh& source,
                                         const TriangleMesh& target,
                                         const IcpSettings& settings) const = 0;
};

/// Factory: create engine from config
MeshEngine::Ptr createMeshEngine(const config::Engine& cfg);

}  // namespace meshtools

#endif  // MESHTOOLS_ENGINE_MESH_ENGINE_HPP
