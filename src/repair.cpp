// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * repair.cpp
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "meshtools/repair/repair.hpp"

#include <spdlog/spdlog.h>

namespace meshtools {

size_t removeDuplicateFaces(MeshSession& session, std::optional<int> mesh_id) {
  auto& mesh = session.select(mesh_id);
  const size_t removed = session.engine().removeDuplicateFaces(mesh);
  spdlog::debug("[Repair] Removed {} duplicate faces", removed);
  return removed;
}

size_t removeDuplicateVertices(MeshSession& session,
                               std::optional<int> mesh_id) {
  auto& mesh = session.select(mesh_id);
  const size_t removed = session.engine().removeDuplicateVertices(mesh);
  spdlog::debug("[Repair] Removed {} duplicate/unreferenced vertices", removed);
  return removed;
}

size_t fillHoles(MeshSession& session, std::optional<int> mesh_id,
                 int max_hole_size, bool self_intersection_guard) {
  auto& mesh = session.select(mesh_id);
  const size_t closed =
      session.engine().closeHoles(mesh, max_hole_size, self_intersection_guard);
  spdlog::debug("[Repair] Closed {} holes (max size {})", closed,
                max_hole_size);
  return closed;
}

NormalsReport fixNormals(MeshSession& session, std::optional<int> mesh_id,
                         bool flip_flipped) {
  auto& mesh = session.select(mesh_id);
  auto& engine = session.engine();

  NormalsReport report;
  report.flipped_faces = engine.reorientFaces(mesh, flip_flipped);
  if (mesh.isPointCloud()) {
    engine.computePointCloudNormals(mesh);
    report.point_cloud = true;
  } else {
    engine.computeVertexNormals(mesh);
  }
  spdlog::debug("[Repair] Normals recomputed, {} faces flipped",
                report.flipped_faces);
  return report;
}

size_t removeIsolatedPieces(MeshSession& session, std::optional<int> mesh_id,
                            int min_component_size) {
  auto& mesh = session.select(mesh_id);
  const size_t removed =
      session.engine().removeSmallComponents(mesh, min_component_size);
  spdlog::debug("[Repair] Removed {} faces in components under {} faces",
                removed, min_component_size);
  return removed;
}

RepairReport repairMesh(MeshSession& session, std::optional<int> mesh_id,
                        const config::Repair& options) {
  session.select(mesh_id);

  RepairReport report;
  if (options.remove_duplicates) {
    report.duplicate_faces = removeDuplicateFaces(session);
    report.duplicate_vertices = removeDuplicateVertices(session);
  }
  if (options.fill_holes) {
    report.holes_filled = fillHoles(session, std::nullopt, options.max_hole_size,
                                    options.self_intersection_guard);
  }
  if (options.reorient_normals) {
    report.normals = fixNormals(session);
  }
  if (options.remove_small_components) {
    report.isolated_pieces =
        removeIsolatedPieces(session, std::nullopt, options.min_component_size);
  }

  const auto& mesh = session.currentMesh();
  spdlog::info("[Repair] Mesh {} repaired: {} vertices, {} faces",
               *session.currentMeshId(), mesh.vertexCount(), mesh.faceCount());
  return report;
}

}  // namespace meshtools
