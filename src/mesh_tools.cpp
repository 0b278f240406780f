// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * mesh_tools.cpp
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "meshtools/server/mesh_tools.hpp"

#include <filesystem>
#include <stdexcept>
#include <vector>

#include "meshtools/alignment/alignment.hpp"
#include "meshtools/batch/batch.hpp"
#include "meshtools/repair/repair.hpp"
#include "meshtools/server/serialization.hpp"
#include "meshtools/session/mesh_session.hpp"

namespace meshtools {
namespace server {

namespace fs = std::filesystem;

namespace {

// ─── Argument access ────────────────────────────────────────────────────────

template <typename T>
T required(const json& args, const char* key) {
  if (!args.contains(key) || args[key].is_null()) {
    throw std::invalid_argument(std::string("Missing required argument '") +
                                key + "'");
  }
  return args[key].get<T>();
}

template <typename T>
T argOr(const json& args, const char* key, const T& fallback) {
  if (!args.contains(key) || args[key].is_null()) return fallback;
  return args[key].get<T>();
}

// ─── Schema building ────────────────────────────────────────────────────────

json stringProp(const std::string& description) {
  return {{"type", "string"}, {"description", description}};
}

json stringProp(const std::string& description, const std::string& def) {
  return {{"type", "string"}, {"description", description}, {"default", def}};
}

json stringArrayProp(const std::string& description) {
  return {{"type", "array"},
          {"items", {{"type", "string"}}},
          {"description", description}};
}

json intProp(const std::string& description, int def) {
  return {{"type", "integer"}, {"description", description}, {"default", def}};
}

json numberProp(const std::string& description, double def) {
  return {{"type", "number"}, {"description", description}, {"default", def}};
}

json boolProp(const std::string& description, bool def) {
  return {{"type", "boolean"}, {"description", description}, {"default", def}};
}

json objectSchema(json properties, const std::vector<std::string>& required) {
  return {{"type", "object"},
          {"properties", std::move(properties)},
          {"required", required}};
}

/// Repair flags shared by repair_mesh and batch_repair
json repairProperties(const config::Repair& r) {
  return {
      {"remove_duplicates",
       boolProp("Remove duplicate faces and vertices.", r.remove_duplicates)},
      {"fill_holes", boolProp("Fill boundary holes.", r.fill_holes)},
      {"max_hole_size",
       intProp("Maximum boundary-edge count of holes to fill.",
               r.max_hole_size)},
      {"self_intersection_guard",
       boolProp("Reject hole patches that fold over the boundary.",
                r.self_intersection_guard)},
      {"reorient_normals",
       boolProp("Recompute and coherently orient face normals.",
                r.reorient_normals)},
      {"remove_small_components",
       boolProp("Delete small disconnected components.",
                r.remove_small_components)},
      {"min_component_size",
       intProp("Minimum face count to keep a component.",
               r.min_component_size)}};
}

config::Repair repairOptions(const json& args, const config::Repair& defaults) {
  config::Repair r = defaults;
  r.remove_duplicates = argOr(args, "remove_duplicates", r.remove_duplicates);
  r.fill_holes = argOr(args, "fill_holes", r.fill_holes);
  r.max_hole_size = argOr(args, "max_hole_size", r.max_hole_size);
  r.self_intersection_guard =
      argOr(args, "self_intersection_guard", r.self_intersection_guard);
  r.reorient_normals = argOr(args, "reorient_normals", r.reorient_normals);
  r.remove_small_components =
      argOr(args, "remove_small_components", r.remove_small_components);
  r.min_component_size = argOr(args, "min_component_size", r.min_component_size);
  return r;
}

config::Icp icpOptions(const json& args, const config::Icp& defaults,
                       const char* sample_key, const char* iterations_key) {
  config::Icp icp = defaults;
  icp.sample_number = argOr(args, sample_key, icp.sample_number);
  icp.max_iterations = argOr(args, iterations_key, icp.max_iterations);
  icp.max_distance_fraction =
      argOr(args, "max_distance_fraction", icp.max_distance_fraction);
  return icp;
}

// ─── Tools ──────────────────────────────────────────────────────────────────

Tool loadMeshTool(MeshEngine::Ptr engine) {
  Tool tool;
  tool.name = "load_mesh";
  tool.description =
      "Load one or more mesh files into a new session and return basic "
      "statistics (vertex/face counts, bounding box) for each mesh.";
  tool.input_schema = objectSchema(
      {{"paths", stringArrayProp("Absolute paths to mesh files to load.")}},
      {"paths"});
  tool.handler = [engine](const json& args) {
    const auto paths = required<std::vector<std::string>>(args, "paths");
    MeshSession session(engine);
    json meshes = json::array();
    for (const auto& path : paths) {
      session.loadMesh(path);
      meshes.push_back(session.meshInfo());
    }
    return json{{"meshes", meshes}};
  };
  return tool;
}

Tool meshInfoTool(MeshEngine::Ptr engine) {
  Tool tool;
  tool.name = "get_mesh_info";
  tool.description =
      "Return vertex count, face count, and bounding-box info for a mesh file.";
  tool.input_schema = objectSchema(
      {{"path", stringProp("Absolute path to the mesh file.")}}, {"path"});
  tool.handler = [engine](const json& args) {
    MeshSession session(engine);
    session.loadMesh(required<std::string>(args, "path"));
    return json(session.meshInfo());
  };
  return tool;
}

Tool repairMeshTool(MeshEngine::Ptr engine, const Config& config) {
  Tool tool;
  tool.name = "repair_mesh";
  tool.description =
      "Repair a mesh file by removing duplicates, filling holes, reorienting "
      "normals, and removing small components. Writes the result to "
      "output_path.";
  json props = repairProperties(config.repair);
  props["input_path"] = stringProp("Path to the input mesh file.");
  props["output_path"] = stringProp("Path to write the repaired mesh.");
  tool.input_schema = objectSchema(props, {"input_path", "output_path"});
  tool.handler = [engine, config](const json& args) {
    const auto input = required<std::string>(args, "input_path");
    const auto output = required<std::string>(args, "output_path");

    MeshSession session(engine);
    session.loadMesh(input);
    const auto report =
        repairMesh(session, std::nullopt, repairOptions(args, config.repair));
    session.saveMesh(output, std::nullopt, config.save);
    return json{{"repair_results", report}, {"output", output}};
  };
  return tool;
}

Tool alignIcpTool(MeshEngine::Ptr engine, const Config& config) {
  Tool tool;
  tool.name = "align_icp";
  tool.description =
      "Align a source mesh onto a target mesh using Iterative Closest Point "
      "(ICP). Writes the aligned source mesh to output_path.";
  tool.input_schema = objectSchema(
      {{"source_path", stringProp("Path to the scan to be aligned.")},
       {"target_path", stringProp("Path to the fixed reference mesh.")},
       {"output_path", stringProp("Path to write the aligned source mesh.")},
       {"sample_number",
        intProp("ICP samples per iteration.", config.icp.sample_number)},
       {"max_iterations",
        intProp("Maximum ICP iterations.", config.icp.max_iterations)},
       {"max_distance_fraction",
        numberProp("Correspondence gate as a fraction of the target "
                   "bounding-box diagonal.",
                   config.icp.max_distance_fraction)}},
      {"source_path", "target_path", "output_path"});
  tool.handler = [engine, config](const json& args) {
    const auto output = required<std::string>(args, "output_path");

    MeshSession session(engine);
    const int target_id = session.loadMesh(required<std::string>(args, "target_path"));
    const int source_id = session.loadMesh(required<std::string>(args, "source_path"));
    const auto result =
        alignIcp(session, source_id, target_id,
                 icpOptions(args, config.icp, "sample_number", "max_iterations"));
    session.saveMesh(output, source_id, config.save);
    return json{{"alignment", result}, {"output", output}};
  };
  return tool;
}

Tool alignPointBasedTool(MeshEngine::Ptr engine, const Config& config) {
  Tool tool;
  tool.name = "align_point_based";
  tool.description =
      "Align a source mesh onto a target mesh from picked point "
      "correspondences (least-squares rigid transform). Without pairs, ICP "
      "is used instead. Writes the aligned source mesh to output_path.";
  const json point = {{"type", "array"},
                      {"items", {{"type", "number"}}},
                      {"minItems", 3},
                      {"maxItems", 3}};
  tool.input_schema = objectSchema(
      {{"source_path", stringProp("Path to the scan to be aligned.")},
       {"target_path", stringProp("Path to the fixed reference mesh.")},
       {"output_path", stringProp("Path to write the aligned source mesh.")},
       {"point_pairs",
        {{"type", "array"},
         {"items",
          {{"type", "array"}, {"items", point}, {"minItems", 2}, {"maxItems", 2}}},
         {"description",
          "Correspondences [[sx, sy, sz], [tx, ty, tz]]; at least 3 "
          "non-collinear pairs."}}}},
      {"source_path", "target_path", "output_path"});
  tool.handler = [engine, config](const json& args) {
    const auto output = required<std::string>(args, "output_path");
    const auto pairs =
        argOr(args, "point_pairs", std::vector<PointCorrespondence>{});

    MeshSession session(engine);
    const int target_id = session.loadMesh(required<std::string>(args, "target_path"));
    const int source_id = session.loadMesh(required<std::string>(args, "source_path"));
    const auto result =
        alignPointBased(session, source_id, target_id, pairs, config.icp);
    session.saveMesh(output, source_id, config.save);
    return json{{"alignment", result}, {"output", output}};
  };
  return tool;
}

Tool globalAlignTool(MeshEngine::Ptr engine, const Config& config) {
  const auto& g = config.global_alignment;
  Tool tool;
  tool.name = "global_align";
  tool.description =
      "Register several scans into the frame of the first one. Loads every "
      "mesh in mesh_paths, aligns them, then saves each to output_dir.";
  tool.input_schema = objectSchema(
      {{"mesh_paths", stringArrayProp("Paths to mesh files to align globally.")},
       {"output_dir", stringProp("Directory to write the aligned meshes.")},
       {"output_format",
        stringProp("Output file extension (e.g. '.ply', '.obj').",
                   config.batch.output_format)},
       {"arc_threshold",
        numberProp("Correspondence distance in percent of the base mesh "
                   "bounding-box diagonal.",
                   g.arc_threshold)},
       {"sample_number", intProp("Points sampled per mesh.", g.sample_number)},
       {"max_iterations", intProp("Maximum ICP iterations.", g.max_iterations)},
       {"min_overlap",
        numberProp("Minimum inlier ratio to accept a pairwise alignment.",
                   g.min_overlap)}},
      {"mesh_paths", "output_dir"});
  tool.handler = [engine, config](const json& args) {
    const auto paths = required<std::vector<std::string>>(args, "mesh_paths");
    const fs::path output_dir(required<std::string>(args, "output_dir"));
    const auto format = normalizeExtension(
        argOr(args, "output_format", config.batch.output_format));

    config::GlobalAlignment params = config.global_alignment;
    params.arc_threshold = argOr(args, "arc_threshold", params.arc_threshold);
    params.sample_number = argOr(args, "sample_number", params.sample_number);
    params.max_iterations = argOr(args, "max_iterations", params.max_iterations);
    params.min_overlap = argOr(args, "min_overlap", params.min_overlap);

    MeshSession session(engine);
    std::vector<int> ids;
    for (const auto& path : paths) ids.push_back(session.loadMesh(path));
    const auto result = globalAlign(session, ids, params);

    json outputs = json::array();
    for (size_t i = 0; i < paths.size(); ++i) {
      const auto out = output_dir / (fs::path(paths[i]).stem().string() + format);
      session.saveMesh(out.string(), ids[i], config.save);
      outputs.push_back(out.string());
    }
    return json{{"alignment", result}, {"outputs", outputs}};
  };
  return tool;
}

Tool batchRepairTool(MeshEngine::Ptr engine, const Config& config) {
  Tool tool;
  tool.name = "batch_repair";
  tool.description =
      "Repair every mesh in an input directory and write results to an "
      "output directory.";
  json props = repairProperties(config.repair);
  props["input_dir"] = stringProp("Directory containing input mesh files.");
  props["output_dir"] = stringProp("Directory where repaired meshes are saved.");
  props["output_format"] =
      stringProp("Output file extension.", config.batch.output_format);
  props["recursive"] =
      boolProp("Process sub-directories recursively.", config.batch.recursive);
  tool.input_schema = objectSchema(props, {"input_dir", "output_dir"});
  tool.handler = [engine, config](const json& args) {
    config::Batch batch = config.batch;
    batch.output_format = argOr(args, "output_format", batch.output_format);
    batch.recursive = argOr(args, "recursive", batch.recursive);

    BatchProcessor processor(engine, batch, config.save);
    const auto records =
        processor.repair(required<std::string>(args, "input_dir"),
                         required<std::string>(args, "output_dir"),
                         repairOptions(args, config.repair));
    return json{{"results", records}, {"summary", summarize(records)}};
  };
  return tool;
}

Tool batchAlignTool(MeshEngine::Ptr engine, const Config& config) {
  Tool tool;
  tool.name = "batch_align";
  tool.description =
      "ICP-align every mesh in an input directory against a single target "
      "(reference) mesh and write aligned meshes to an output directory.";
  tool.input_schema = objectSchema(
      {{"input_dir", stringProp("Directory of scan files to align.")},
       {"target_mesh", stringProp("Path to the fixed reference mesh.")},
       {"output_dir", stringProp("Directory where aligned meshes are saved.")},
       {"output_format",
        stringProp("Output file extension.", config.batch.output_format)},
       {"icp_sample_number",
        intProp("ICP samples per iteration.", config.icp.sample_number)},
       {"icp_max_iterations",
        intProp("Maximum ICP iterations.", config.icp.max_iterations)},
       {"recursive",
        boolProp("Process sub-directories recursively.",
                 config.batch.recursive)}},
      {"input_dir", "target_mesh", "output_dir"});
  tool.handler = [engine, config](const json& args) {
    config::Batch batch = config.batch;
    batch.output_format = argOr(args, "output_format", batch.output_format);
    batch.recursive = argOr(args, "recursive", batch.recursive);

    BatchProcessor processor(engine, batch, config.save);
    const auto records = processor.align(
        required<std::string>(args, "input_dir"),
        required<std::string>(args, "output_dir"),
        required<std::string>(args, "target_mesh"),
        icpOptions(args, config.icp, "icp_sample_number", "icp_max_iterations"));
    return json{{"results", records}, {"summary", summarize(records)}};
  };
  return tool;
}

}  // namespace

void registerMeshTools(ToolServer& server, MeshEngine::Ptr engine,
                       const Config& config) {
  if (!engine) throw std::invalid_argument("registerMeshTools requires an engine");

  server.registerTool(loadMeshTool(engine));
  server.registerTool(meshInfoTool(engine));
  server.registerTool(repairMeshTool(engine, config));
  server.registerTool(alignIcpTool(engine, config));
  server.registerTool(alignPointBasedTool(engine, config));
  server.registerTool(globalAlignTool(engine, config));
  server.registerTool(batchRepairTool(engine, config));
  server.registerTool(batchAlignTool(engine, config));
}

}  // namespace server
}  // namespace meshtools
