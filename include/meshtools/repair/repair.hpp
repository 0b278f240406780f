// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * repair.hpp
 *
 * Mesh repair steps on session meshes and the combined repair pipeline.
 * Every step acts on mesh_id (made current) or on the current mesh.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef MESHTOOLS_REPAIR_REPAIR_HPP
#define MESHTOOLS_REPAIR_REPAIR_HPP

#include <optional>
#include <string>

#include "meshtools/config/repair.hpp"
#include "meshtools/session/mesh_session.hpp"

namespace meshtools {

struct NormalsReport {
  std::string status = "ok";
  size_t flipped_faces = 0;
  bool point_cloud = false;  ///< Normals were estimated, not derived from faces
};

/// Results of the steps repairMesh() actually ran.
struct RepairReport {
  std::optional<size_t> duplicate_faces;     ///< Faces removed
  std::optional<size_t> duplicate_vertices;  ///< Vertices removed
  std::optional<size_t> holes_filled;
  std::optional<NormalsReport> normals;
  std::optional<size_t> isolated_pieces;  ///< Faces removed
};

/// @return Faces removed
size_t removeDuplicateFaces(MeshSession& session,
                            std::optional<int> mesh_id = {});

/// Merge coincident vertices, then drop unreferenced ones. @return Removed
size_t removeDuplicateVertices(MeshSession& session,
                               std::optional<int> mesh_id = {});

/**
 * @brief Close holes with at most max_hole_size boundary edges.
 * @return Holes closed (larger holes are left open)
 */
size_t fillHoles(MeshSession& session, std::optional<int> mesh_id = {},
                 int max_hole_size = 30, bool self_intersection_guard = true);

/**
 * @brief Orient faces coherently and recompute vertex normals.
 *
 * flip_flipped additionally turns every component outward. Point clouds get
 * estimated normals instead.
 */
NormalsReport fixNormals(MeshSession& session, std::optional<int> mesh_id = {},
                         bool flip_flipped = true);

/// Drop components with fewer than min_component_size faces. @return Removed
size_t removeIsolatedPieces(MeshSession& session,
                            std::optional<int> mesh_id = {},
                            int min_component_size = 25);

/**
 * @brief Runs the enabled steps in order: duplicate faces, duplicate
 * vertices, hole filling, normals, small components.
 */
RepairReport repairMesh(MeshSession& session, std::optional<int> mesh_id = {},
                        const config::Repair& options = {});

}  // namespace meshtools

#endif  // MESHTOOLS_REPAIR_REPAIR_HPP
