// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * meshtools: Inspect, repair and align meshes from the command line.
 *
 * Usage:
 *   ./meshtools [--config cfg.yaml] <command> <args...>
 *
 * Commands:
 *   info          <mesh>...
 *   repair        <input> <output>
 *   align-icp     <source> <target> <output>
 *   align-points  <source> <target> <output> <pairs.json>
 *   global-align  <output_dir> <mesh> <mesh>...
 *   batch-repair  <input_dir> <output_dir>
 *   batch-align   <input_dir> <target> <output_dir>
 *
 * Results are printed as JSON on stdout.
 *
 * Example:
 *   ./meshtools align-icp scan_02.ply scan_01.ply scan_02_aligned.ply
 */

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <meshtools/meshtools.hpp>
#include <meshtools/server/serialization.hpp>
#include <optional>
#include <string>
#include <vector>

using namespace meshtools;
using nlohmann::json;

namespace {

void printUsage() {
  std::cerr
      << "Usage: meshtools [--config <cfg.yaml>] <command> <args...>\n"
      << "  info          <mesh>...\n"
      << "  repair        <input> <output>\n"
      << "  align-icp     <source> <target> <output>\n"
      << "  align-points  <source> <target> <output> <pairs.json>\n"
      << "  global-align  <output_dir> <mesh> <mesh>...\n"
      << "  batch-repair  <input_dir> <output_dir>\n"
      << "  batch-align   <input_dir> <target> <output_dir>\n"
      << "  pairs.json: [[[sx, sy, sz], [tx, ty, tz]], ...]\n";
}

std::vector<PointCorrespondence> loadPairs(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw std::runtime_error("Cannot open point pairs file: " + path);
  return json::parse(in).get<std::vector<PointCorrespondence>>();
}

/// Runs one command; nullopt on unknown command or wrong argument count.
std::optional<json> runCommand(const std::string& command,
                               const std::vector<std::string>& args,
                               const Config& config, MeshEngine::Ptr engine) {
  if (command == "info" && !args.empty()) {
    MeshSession session(engine);
    json meshes = json::array();
    for (const auto& path : args) {
      session.loadMesh(path);
      meshes.push_back(session.meshInfo());
    }
    return json{{"meshes", meshes}};
  }

  if (command == "repair" && args.size() == 2) {
    MeshSession session(engine);
    session.loadMesh(args[0]);
    const auto report = repairMesh(session, std::nullopt, config.repair);
    session.saveMesh(args[1], std::nullopt, config.save);
    return json{{"repair_results", report}, {"output", args[1]}};
  }

  if (command == "align-icp" && args.size() == 3) {
    MeshSession session(engine);
    const int target = session.loadMesh(args[1]);
    const int source = session.loadMesh(args[0]);
    const auto result = alignIcp(session, source, target, config.icp);
    session.saveMesh(args[2], source, config.save);
    return json{{"alignment", result}, {"output", args[2]}};
  }

  if (command == "align-points" && args.size() == 4) {
    const auto pairs = loadPairs(args[3]);
    MeshSession session(engine);
    const int target = session.loadMesh(args[1]);
    const int source = session.loadMesh(args[0]);
    const auto result =
        alignPointBased(session, source, target, pairs, config.icp);
    session.saveMesh(args[2], source, config.save);
    return json{{"alignment", result}, {"output", args[2]}};
  }

  if (command == "global-align" && args.size() >= 3) {
    const std::filesystem::path output_dir(args[0]);
    MeshSession session(engine);
    std::vector<int> ids;
    for (size_t i = 1; i < args.size(); ++i) {
      ids.push_back(session.loadMesh(args[i]));
    }
    const auto result = globalAlign(session, ids, config.global_alignment);

    json outputs = json::array();
    for (size_t i = 0; i < ids.size(); ++i) {
      const auto stem = std::filesystem::path(args[i + 1]).stem().string();
      const auto out = output_dir / (stem + config.batch.output_format);
      session.saveMesh(out.string(), ids[i], config.save);
      outputs.push_back(out.string());
    }
    return json{{"alignment", result}, {"outputs", outputs}};
  }

  if (command == "batch-repair" && args.size() == 2) {
    BatchProcessor processor(engine, config.batch, config.save);
    const auto records = processor.repair(args[0], args[1], config.repair);
    return json{{"results", records}, {"summary", summarize(records)}};
  }

  if (command == "batch-align" && args.size() == 3) {
    BatchProcessor processor(engine, config.batch, config.save);
    const auto records =
        processor.align(args[0], args[2], args[1], config.icp);
    return json{{"results", records}, {"summary", summarize(records)}};
  }

  return std::nullopt;
}

}  // namespace

int main(int argc, char** argv) {
  // stdout carries the JSON result
  spdlog::set_default_logger(spdlog::stderr_color_mt("meshtools"));

  std::string config_path;
  std::vector<std::string> positional;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "-h" || arg == "--help") {
      printUsage();
      return 0;
    } else {
      positional.push_back(arg);
    }
  }

  if (positional.empty()) {
    printUsage();
    return 1;
  }

  const std::string command = positional.front();
  const std::vector<std::string> args(positional.begin() + 1, positional.end());

  try {
    Config config = config_path.empty() ? Config{} : loadConfig(config_path);
    applyLogging(config.logging);

    auto engine = createMeshEngine(config.engine);
    const auto result = runCommand(command, args, config, engine);
    if (!result) {
      std::cerr << "Unknown command or wrong arguments: " << command << "\n";
      printUsage();
      return 1;
    }
    std::cout << result->dump(2, ' ', false, json::error_handler_t::replace)
              << std::endl;
  } catch (const std::exception& e) {
    spdlog::error("{}", e.what());
    return 1;
  }

  return 0;
}
