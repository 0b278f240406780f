// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#include "meshtools/server/serialization.hpp"

#include <stdexcept>

namespace meshtools {

using nlohmann::json;

namespace {

json toArray(const Eigen::Vector3d& v) { return json::array({v.x(), v.y(), v.z()}); }

Eigen::Vector3d toVector(const json& j) {
  if (!j.is_array() || j.size() != 3) {
    throw std::invalid_argument("Expected a point [x, y, z], got " + j.dump());
  }
  return {j[0].get<double>(), j[1].get<double>(), j[2].get<double>()};
}

}  // namespace

void to_json(json& j, const RigidTransform& transform) {
  const Eigen::Matrix4d m = transform.matrix();
  j = json::array();
  for (int r = 0; r < 4; ++r) {
    j.push_back(json::array({m(r, 0), m(r, 1), m(r, 2), m(r, 3)}));
  }
}

void to_json(json& j, const BoundingBox& bbox) {
  if (!bbox.isValid()) {
    j = {{"min", nullptr}, {"max", nullptr}, {"diagonal", 0.0}};
    return;
  }
  j = {{"min", toArray(bbox.min)},
       {"max", toArray(bbox.max)},
       {"diagonal", bbox.diagonal()}};
}

void to_json(json& j, const MeshInfo& info) {
  j = {{"mesh_id", info.mesh_id},
       {"name", info.name},
       {"vertex_count", info.vertex_count},
       {"face_count", info.face_count},
       {"bounding_box", info.bounding_box}};
}

void to_json(json& j, const IcpResult& result) {
  j = {{"source_mesh_id", result.source_mesh_id},
       {"target_mesh_id", result.target_mesh_id},
       {"iterations_performed", result.iterations_performed},
       {"final_rms_error", result.final_rms_error},
       {"fitness", result.fitness},
       {"converged", result.converged},
       {"transform", result.transform}};
}

void to_json(json& j, const PointBasedResult& result) {
  j = {{"source_mesh_id", result.source_mesh_id},
       {"target_mesh_id", result.target_mesh_id},
       {"method", result.method},
       {"pairs_used", result.pairs_used},
       {"rms_error", result.rms_error},
       {"transform", result.transform}};
  if (result.icp) {
    j["iterations_performed"] = result.icp->iterations_performed;
    j["final_rms_error"] = result.icp->final_rms_error;
  }
}

void to_json(json& j, const PairwiseAlignment& arc) {
  j = {{"mesh_id", arc.mesh_id},
       {"accepted", arc.accepted},
       {"iterations", arc.iterations},
       {"rms_error", arc.rms_error},
       {"fitness", arc.fitness},
       {"transform", arc.transform}};
}

void to_json(json& j, const GlobalAlignResult& result) {
  j = {{"base_mesh_id", result.base_mesh_id},
       {"aligned_mesh_ids", result.aligned_mesh_ids},
       {"unaligned_mesh_ids", result.unaligned_mesh_ids},
       {"global_rms_error", result.global_rms_error},
       {"pairwise", result.pairwise}};
}

void to_json(json& j, const NormalsReport& report) {
  j = {{"status", report.status},
       {"flipped_faces", report.flipped_faces},
       {"point_cloud", report.point_cloud}};
}

void to_json(json& j, const RepairReport& report) {
  j = json::object();
  if (report.duplicate_faces) {
    j["duplicate_faces"] = {{"removed_faces", *report.duplicate_faces}};
  }
  if (report.duplicate_vertices) {
    j["duplicate_vertices"] = {{"removed_vertices", *report.duplicate_vertices}};
  }
  if (report.holes_filled) {
    j["hole_filling"] = {{"holes_filled", *report.holes_filled}};
  }
  if (report.normals) j["normals"] = *report.normals;
  if (report.isolated_pieces) {
    j["isolated_pieces"] = {{"removed_faces", *report.isolated_pieces}};
  }
}

void to_json(json& j, const BatchRecord& record) {
  j = {{"input", record.input},
       {"output", record.output},
       {"status", toString(record.status)}};
  if (record.status == BatchStatus::Error) j["error"] = record.error;
  if (record.repair) j["repair"] = *record.repair;
  if (record.alignment) j["alignment"] = *record.alignment;
}

void to_json(json& j, const BatchSummary& summary) {
  j = {{"total", summary.total}, {"ok", summary.ok}, {"failed", summary.failed}};
}

void from_json(const json& j, PointCorrespondence& pair) {
  if (!j.is_array() || j.size() != 2) {
    throw std::invalid_argument(
        "Expected a point pair [[sx, sy, sz], [tx, ty, tz]], got " + j.dump());
  }
  pair.source = toVector(j[0]);
  pair.target = toVector(j[1]);
}

}  // namespace meshtools
