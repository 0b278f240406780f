// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * alignment.hpp
 *
 * Scan alignment on session meshes: pairwise ICP, alignment from picked
 * point pairs, and multi-view registration against a fixed base mesh.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef MESHTOOLS_ALIGNMENT_ALIGNMENT_HPP
#define MESHTOOLS_ALIGNMENT_ALIGNMENT_HPP

#include <optional>
#include <string>
#include <vector>

#include "meshtools/alignment/rigid_transform.hpp"
#include "meshtools/config/alignment.hpp"
#include "meshtools/session/mesh_session.hpp"

namespace meshtools {

struct IcpResult {
  int source_mesh_id = -1;
  int target_mesh_id = -1;
  size_t iterations_performed = 0;
  double final_rms_error = 0.0;
  double fitness = 0.0;
  bool converged = false;
  RigidTransform transform;  ///< Applied to the source
};

struct PointBasedResult {
  int source_mesh_id = -1;
  int target_mesh_id = -1;
  std::string method;     ///< "point_based" or "icp_fallback"
  size_t pairs_used = 0;  ///< 0 for the ICP fallback
  double rms_error = 0.0;
  RigidTransform transform;
  std::optional<IcpResult> icp;  ///< Set for the ICP fallback
};

/// One mesh registered against the already-aligned set.
struct PairwiseAlignment {
  int mesh_id = -1;
  size_t iterations = 0;
  double rms_error = 0.0;
  double fitness = 0.0;
  bool accepted = false;
  RigidTransform transform;  ///< Identity when rejected
};

struct GlobalAlignResult {
  int base_mesh_id = -1;
  std::vector<int> aligned_mesh_ids;    ///< Base first, then in alignment order
  std::vector<int> unaligned_mesh_ids;  ///< Left in place (insufficient overlap)
  double global_rms_error = 0.0;
  std::vector<PairwiseAlignment> pairwise;
};

/// Engine request from ICP parameters; the gate scales with the target size.
IcpSettings icpSettings(const config::Icp& params, const TriangleMesh& target);

/**
 * @brief Registers the source onto the target with ICP.
 *
 * The source mesh is moved in place (and made current); the target is not
 * modified.
 *
 * @throws std::out_of_range unknown mesh id
 * @throws std::invalid_argument source == target or empty meshes
 */
IcpResult alignIcp(MeshSession& session, int source_mesh_id,
                   int target_mesh_id, const config::Icp& params = {});

/**
 * @brief Aligns the source from explicit point correspondences.
 *
 * With no pairs, falls back to alignIcp() using `fallback` and reports
 * method "icp_fallback". Aligner errors propagate before the session is
 * touched.
 *
 * @throws InsufficientCorrespondencesError, DegenerateGeometryError
 */
PointBasedResult alignPointBased(MeshSession& session, int source_mesh_id,
                                 int target_mesh_id,
                                 const std::vector<PointCorrespondence>& pairs,
                                 const config::Icp& fallback = {});

/**
 * @brief Multi-view registration against the first mesh.
 *
 * Every other mesh is registered against the union of the meshes aligned so
 * far, and is accepted when its overlap (ICP fitness) reaches
 * params.min_overlap. Meshes rejected in one pass are retried after the
 * aligned set has grown; meshes never accepted stay where they are.
 *
 * @param mesh_ids Meshes to align (all session meshes when nullopt)
 * @throws std::invalid_argument fewer than two meshes, or a repeated id
 */
GlobalAlignResult globalAlign(MeshSession& session,
                              const std::optional<std::vector<int>>& mesh_ids,
                              const config::GlobalAlignment& params = {});

}  // namespace meshtools

#endif  // MESHTOOLS_ALIGNMENT_ALIGNMENT_HPP
