// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * alignment.cpp
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "meshtools/alignment/alignment.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <set>
#include <stdexcept>

namespace meshtools {

IcpSettings icpSettings(const config::Icp& params, const TriangleMesh& target) {
  IcpSettings settings;
  settings.sample_number = params.sample_number;
  settings.max_iterations = params.max_iterations;
  settings.max_correspondence_distance =
      params.max_distance_fraction * target.boundingBox().diagonal();
  return settings;
}

IcpResult alignIcp(MeshSession& session, int source_mesh_id,
                   int target_mesh_id, const config::Icp& params) {
  if (source_mesh_id == target_mesh_id) {
    throw std::invalid_argument("ICP source and target must differ (both " +
                                std::to_string(source_mesh_id) + ")");
  }
  const auto& target = session.mesh(target_mesh_id);
  auto& source = session.select(source_mesh_id);

  const auto settings = icpSettings(params, target);
  if (!(settings.max_correspondence_distance > 0.0)) {
    throw std::invalid_argument("Target mesh " +
                                std::to_string(target_mesh_id) +
                                " has a degenerate bounding box");
  }

  const auto report = session.engine().registerIcp(source, target, settings);
  source.transform(report.transform);

  IcpResult result;
  result.source_mesh_id = source_mesh_id;
  result.target_mesh_id = target_mesh_id;
  result.iterations_performed = report.iterations;
  result.final_rms_error = report.rmse;
  result.fitness = report.fitness;
  result.converged = report.converged;
  result.transform = RigidTransform::fromIsometry(report.transform);

  spdlog::info("[Alignment] ICP mesh {} -> {}: {} iterations, rms {:.6g}",
               source_mesh_id, target_mesh_id, result.iterations_performed,
               result.final_rms_error);
  return result;
}

PointBasedResult alignPointBased(MeshSession& session, int source_mesh_id,
                                 int target_mesh_id,
                                 const std::vector<PointCorrespondence>& pairs,
                                 const config::Icp& fallback) {
  PointBasedResult result;
  result.source_mesh_id = source_mesh_id;
  result.target_mesh_id = target_mesh_id;

  if (pairs.empty()) {
    spdlog::info("[Alignment] No point pairs given, falling back to ICP");
    auto icp = alignIcp(session, source_mesh_id, target_mesh_id, fallback);
    result.method = "icp_fallback";
    result.rms_error = icp.final_rms_error;
    result.transform = icp.transform;
    result.icp = icp;
    return result;
  }

  // Validate ids and solve before touching the session
  session.mesh(target_mesh_id);
  session.mesh(source_mesh_id);
  const auto transform = estimateRigidTransform(pairs);

  session.select(source_mesh_id).transform(transform.isometry());

  result.method = "point_based";
  result.pairs_used = pairs.size();
  result.rms_error = rmsError(pairs, transform);
  result.transform = transform;

  spdlog::info("[Alignment] Point-based mesh {} -> {}: {} pairs, rms {:.6g}",
               source_mesh_id, target_mesh_id, result.pairs_used,
               result.rms_error);
  return result;
}

GlobalAlignResult globalAlign(MeshSession& session,
                              const std::optional<std::vector<int>>& mesh_ids,
                              const config::GlobalAlignment& params) {
  const auto ids = mesh_ids ? *mesh_ids : session.meshIds();
  if (ids.size() < 2) {
    throw std::invalid_argument("Global alignment needs at least 2 meshes, got " +
                                std::to_string(ids.size()));
  }
  for (int id : ids) session.mesh(id);
  if (std::set<int>(ids.begin(), ids.end()).size() != ids.size()) {
    throw std::invalid_argument("Global alignment mesh ids must be distinct");
  }

  GlobalAlignResult result;
  result.base_mesh_id = ids.front();
  result.aligned_mesh_ids.push_back(result.base_mesh_id);

  const auto& base = session.mesh(result.base_mesh_id);
  const double diagonal = base.boundingBox().diagonal();
  if (!(diagonal > 0.0)) {
    throw std::invalid_argument("Base mesh " +
                                std::to_string(result.base_mesh_id) +
                                " has a degenerate bounding box");
  }

  IcpSettings settings;
  settings.sample_number = params.sample_number;
  settings.max_iterations = params.max_iterations;
  settings.max_correspondence_distance = params.arc_threshold / 100.0 * diagonal;

  // Vertices of every accepted mesh, in the base frame
  TriangleMesh reference;
  reference.vertices = base.vertices;

  std::vector<int> pending(ids.begin() + 1, ids.end());
  double weighted_sq = 0.0;
  double weight = 0.0;

  bool progress = true;
  while (!pending.empty() && progress) {
    progress = false;
    std::vector<int> rejected;

    for (int id : pending) {
      auto& mesh = session.mesh(id);
      const auto report =
          session.engine().registerIcp(mesh, reference, settings);

      PairwiseAlignment arc;
      arc.mesh_id = id;
      arc.iterations = report.iterations;
      arc.rms_error = report.rmse;
      arc.fitness = report.fitness;
      arc.accepted = report.fitness > 0.0 && report.fitness >= params.min_overlap &&
                     std::isfinite(report.rmse);

      if (arc.accepted) {
        mesh.transform(report.transform);
        reference.vertices.insert(reference.vertices.end(),
                                  mesh.vertices.begin(), mesh.vertices.end());
        arc.transform = RigidTransform::fromIsometry(report.transform);
        result.aligned_mesh_ids.push_back(id);

        const double w = static_cast<double>(report.correspondences);
        weighted_sq += w * report.rmse * report.rmse;
        weight += w;
        progress = true;
      } else {
        rejected.push_back(id);
      }
      result.pairwise.push_back(arc);
    }
    pending = std::move(rejected);
  }

  result.unaligned_mesh_ids = pending;
  result.global_rms_error = weight > 0.0 ? std::sqrt(weighted_sq / weight) : 0.0;

  spdlog::info("[Alignment] Global: base {}, {} aligned, {} unaligned, rms {:.6g}",
               result.base_mesh_id, result.aligned_mesh_ids.size(),
               result.unaligned_mesh_ids.size(), result.global_rms_error);
  return result;
}

}  // namespace meshtools
