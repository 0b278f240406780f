// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * mesh_tools.hpp
 *
 * Mesh tools exposed by the tool server. Every call works on a fresh
 * session: files in, files out, JSON summary back. Omitted arguments take
 * their defaults from the loaded configuration.
 *
 *   load_mesh          paths[]                    → meshes[]
 *   get_mesh_info      path                       → mesh info
 *   repair_mesh        input_path, output_path    → repair_results
 *   align_icp          source/target/output_path  → alignment
 *   align_point_based  ... + point_pairs          → alignment
 *   global_align       mesh_paths[], output_dir   → alignment, outputs[]
 *   batch_repair       input_dir, output_dir      → results[], summary
 *   batch_align        input_dir, target_mesh, output_dir
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef MESHTOOLS_SERVER_MESH_TOOLS_HPP
#define MESHTOOLS_SERVER_MESH_TOOLS_HPP

#include "meshtools/config/meshtools.hpp"
#include "meshtools/engine/mesh_engine.hpp"
#include "meshtools/server/tool_server.hpp"

namespace meshtools {
namespace server {

void registerMeshTools(ToolServer& server, MeshEngine::Ptr engine,
                       const Config& config);

}  // namespace server
}  // namespace meshtools

#endif  // MESHTOOLS_SERVER_MESH_TOOLS_HPP
