// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * builtin_engine.cpp
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "meshtools/engine/builtin_engine.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <nanopcl/registration/align.hpp>
#include <numeric>
#include <random>
#include <stdexcept>
#include <string>

#include "meshtools/io/cloud_convert.hpp"
#include "meshtools/io/mesh_io.hpp"
#include "meshtools/io/open3d_convert.hpp"
#include "meshtools/processing/cleaning.hpp"
#include "meshtools/processing/hole_filling.hpp"
#include "meshtools/processing/normals.hpp"

namespace meshtools {

BuiltinEngine::BuiltinEngine(const config::Engine& cfg) : cfg_(cfg) {
  routeOpen3DLogging();
}

bool BuiltinEngine::canRead(const std::string& path) const {
  return io::canRead(path);
}

TriangleMesh BuiltinEngine::load(const std::string& path) const {
  return io::loadMesh(path);
}

void BuiltinEngine::save(const TriangleMesh& mesh, const std::string& path,
                         const SaveOptions& options) const {
  io::saveMesh(path, mesh, options);
}

size_t BuiltinEngine::removeDuplicateFaces(TriangleMesh& mesh) const {
  return processing::removeDuplicateFaces(mesh);
}

size_t BuiltinEngine::removeDuplicateVertices(TriangleMesh& mesh) const {
  return processing::removeDuplicateVertices(mesh);
}

size_t BuiltinEngine::removeSmallComponents(TriangleMesh& mesh,
                                            int min_component_size) const {
  return processing::removeSmallComponents(mesh, min_component_size);
}

size_t BuiltinEngine::closeHoles(TriangleMesh& mesh, int max_hole_size,
                                 bool self_intersection_guard) const {
  return processing::fillHoles(mesh, max_hole_size, self_intersection_guard);
}

size_t BuiltinEngine::reorientFaces(TriangleMesh& mesh,
                                    bool make_outward) const {
  return processing::orientFaces(mesh, make_outward);
}

void BuiltinEngine::computeVertexNormals(TriangleMesh& mesh) const {
  processing::computeVertexNormals(mesh);
}

void BuiltinEngine::computePointCloudNormals(TriangleMesh& mesh) const {
  processing::estimatePointNormals(mesh, cfg_.normal_neighbors);
}

RegistrationReport BuiltinEngine::registerIcp(
    const TriangleMesh& source, const TriangleMesh& target,
    const IcpSettings& settings) const {
  if (source.empty() || target.empty()) {
    throw std::invalid_argument("ICP requires non-empty source and target");
  }
  if (!(settings.max_correspondence_distance > 0.0)) {
    throw std::invalid_argument(
        "ICP max_correspondence_distance must be > 0");
  }

  // Deterministic source subset
  std::vector<size_t> all(source.vertexCount());
  std::iota(all.begin(), all.end(), 0);
  std::vector<size_t> sampled;
  const auto wanted = static_cast<size_t>(std::max(settings.sample_number, 3));
  if (all.size() > wanted) {
    std::mt19937 rng(cfg_.sample_seed);
    sampled.reserve(wanted);
    std::sample(all.begin(), all.end(), std::back_inserter(sampled), wanted,
                rng);
  } else {
    sampled = std::move(all);
  }

  TriangleMesh source_positions;
  source_positions.vertices = source.vertices;
  TriangleMesh target_positions;
  target_positions.vertices = target.vertices;
  const auto source_cloud = toPointCloud(source_positions, sampled);
  const auto target_cloud = toPointCloud(target_positions);

  nanopcl::registration::AlignSettings align;
  align.max_correspondence_dist =
      static_cast<float>(settings.max_correspondence_distance);
  align.max_iterations = std::max(settings.max_iterations, 1);
  align.min_correspondences = std::min<size_t>(10, sampled.size());

  const auto result = nanopcl::registration::alignICP(
      source_cloud, target_cloud, Eigen::Isometry3d::Identity(), align);

  RegistrationReport report;
  report.transform = result.transform;
  report.iterations = result.iterations;
  report.fitness = result.fitness;
  report.rmse = result.rmse;
  report.correspondences = static_cast<size_t>(
      std::lround(result.fitness * static_cast<double>(sampled.size())));
  report.converged = result.converged;

  spdlog::debug(
      "[BuiltinEngine] ICP: {} pts, gate {:.4g}, {} iters, rmse {:.4g}, "
      "fitness {:.3f}{}",
      sampled.size(), settings.max_correspondence_distance, report.iterations,
      report.rmse, report.fitness, report.converged ? "" : " (not converged)");
  return report;
}

MeshEngine::Ptr createMeshEngine(const config::Engine& cfg) {
  // Unknown names in the config file already map to Builtin
  switch (cfg.type) {
    case EngineType::Builtin:
      return std::make_shared<BuiltinEngine>(cfg);
  }
  throw std::invalid_argument("Unknown engine type " +
                              std::to_string(static_cast<int>(cfg.type)));
}

}  // namespace meshtools
