// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * mesh_session.cpp
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "meshtools/session/mesh_session.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <stdexcept>

#include "meshtools/io/mesh_io.hpp"

namespace meshtools {

namespace fs = std::filesystem;

MeshSession::MeshSession(MeshEngine::Ptr engine) : engine_(std::move(engine)) {
  if (!engine_) {
    throw std::invalid_argument("MeshSession requires an engine");
  }
}

int MeshSession::loadMesh(const std::string& path) {
  auto mesh = engine_->load(path);
  if (mesh.name.empty()) mesh.name = fs::path(path).stem().string();

  const int id = addMesh(std::move(mesh));
  spdlog::info("[MeshSession] Loaded '{}' as mesh {} ({} vertices, {} faces)",
               path, id, meshes_.at(id).vertexCount(),
               meshes_.at(id).faceCount());
  return id;
}

int MeshSession::addMesh(TriangleMesh mesh) {
  const int id = next_id_++;
  meshes_.emplace(id, std::move(mesh));
  current_ = id;
  return id;
}

void MeshSession::saveMesh(const std::string& path, std::optional<int> mesh_id,
                           const SaveOptions& options) {
  const auto& m = select(mesh_id);

  const fs::path parent = fs::path(path).parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
      throw io::MeshIOError("Cannot create directory " + parent.string() +
                            ": " + ec.message());
    }
  }

  engine_->save(m, path, options);
  spdlog::info("[MeshSession] Saved mesh {} to '{}'", *current_, path);
}

void MeshSession::setActiveMesh(int mesh_id) {
  if (!hasMesh(mesh_id)) {
    throw std::out_of_range("Unknown mesh id " + std::to_string(mesh_id));
  }
  current_ = mesh_id;
}

void MeshSession::deleteMesh(int mesh_id) {
  if (meshes_.erase(mesh_id) == 0) {
    throw std::out_of_range("Unknown mesh id " + std::to_string(mesh_id));
  }
  if (current_ == mesh_id) {
    current_ = meshes_.empty() ? std::nullopt
                               : std::optional<int>(meshes_.rbegin()->first);
  }
  spdlog::debug("[MeshSession] Deleted mesh {}", mesh_id);
}

std::vector<int> MeshSession::meshIds() const {
  std::vector<int> ids;
  ids.reserve(meshes_.size());
  for (const auto& [id, mesh] : meshes_) ids.push_back(id);
  return ids;
}

TriangleMesh& MeshSession::mesh(int mesh_id) {
  auto it = meshes_.find(mesh_id);
  if (it == meshes_.end()) {
    throw std::out_of_range("Unknown mesh id " + std::to_string(mesh_id));
  }
  return it->second;
}

const TriangleMesh& MeshSession::mesh(int mesh_id) const {
  auto it = meshes_.find(mesh_id);
  if (it == meshes_.end()) {
    throw std::out_of_range("Unknown mesh id " + std::to_string(mesh_id));
  }
  return it->second;
}

TriangleMesh& MeshSession::currentMesh() {
  if (!current_) throw std::runtime_error("No mesh loaded in session");
  return meshes_.at(*current_);
}

const TriangleMesh& MeshSession::currentMesh() const {
  if (!current_) throw std::runtime_error("No mesh loaded in session");
  return meshes_.at(*current_);
}

TriangleMesh& MeshSession::select(std::optional<int> mesh_id) {
  if (mesh_id) setActiveMesh(*mesh_id);
  return currentMesh();
}

MeshInfo MeshSession::meshInfo(std::optional<int> mesh_id) {
  const auto& m = select(mesh_id);

  MeshInfo info;
  info.mesh_id = *current_;
  info.name = m.name;
  info.vertex_count = m.vertexCount();
  info.face_count = m.faceCount();
  info.bounding_box = m.boundingBox();
  return info;
}

std::vector<MeshInfo> MeshSession::listMeshes() {
  const auto original = current_;

  std::vector<MeshInfo> infos;
  infos.reserve(meshes_.size());
  for (const auto& [id, mesh] : meshes_) infos.push_back(meshInfo(id));

  current_ = original;
  return infos;
}

}  // namespace meshtools
