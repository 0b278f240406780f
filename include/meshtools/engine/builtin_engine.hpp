// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * builtin_engine.hpp
 *
 * In-process engine. File I/O, topology clean-up, face orientation and
 * vertex normals run on Open3D (through meshtools::io and
 * meshtools::processing); PCD files, ICP registration and point-cloud
 * normals on nanoPCL; hole filling in meshtools::processing.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef MESHTOOLS_ENGINE_BUILTIN_ENGINE_HPP
#define MESHTOOLS_ENGINE_BUILTIN_ENGINE_HPP

#include "meshtools/engine/mesh_engine.hpp"

namespace meshtools {

class BuiltinEngine : public MeshEngine {
 public:
  explicit BuiltinEngine(const config::Engine& cfg = {});

  std::string name() const override { return "builtin"; }

  bool canRead(const std::string& path) const override;
  TriangleMesh load(const std::string& path) const override;
  void save(const TriangleMesh& mesh, const std::string& path,
            const SaveOptions& options) const override;

  size_t removeDuplicateFaces(TriangleMesh& mesh) const override;
  size_t removeDuplicateVertices(TriangleMesh& mesh) const override;
  size_t removeSmallComponents(TriangleMesh& mesh,
                               int min_component_size) const override;
  size_t closeHoles(TriangleMesh& mesh, int max_hole_size,
                    bool self_intersection_guard) const override;

  size_t reorientFaces(TriangleMesh& mesh, bool make_outward) const override;
  void computeVertexNormals(TriangleMesh& mesh) const override;
  void computePointCloudNormals(TriangleMesh& mesh) const override;

  /**
   * Point-to-point ICP (nanoPCL). When the source has more vertices than
   * settings.sample_number, a subset is drawn with the configured seed so
   * repeated runs give identical results.
   */
  RegistrationReport registerIcp(const TriangleMesh& source,
                                 const TriangleMesh& target,
                                 const IcpSettings& settings) const override;

 private:
  config::Engine cfg_;
};

}  // namespace meshtools

#endif  // MESHTOOLS_ENGINE_BUILTIN_ENGINE_HPP
