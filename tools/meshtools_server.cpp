// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * meshtools_server: Mesh tools over the Model Context Protocol (stdio).
 *
 * Reads one JSON-RPC message per line from stdin and answers on stdout.
 * Logs go to stderr.
 *
 * Usage:
 *   ./meshtools_server [cfg.yaml]
 */

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <meshtools/meshtools.hpp>
#include <meshtools/server/mesh_tools.hpp>
#include <meshtools/server/tool_server.hpp>
#include <string>

using namespace meshtools;

int main(int argc, char** argv) {
  spdlog::set_default_logger(spdlog::stderr_color_mt("meshtools_server"));

  if (argc > 2) {
    std::cerr << "Usage: meshtools_server [cfg.yaml]\n";
    return 1;
  }

  try {
    Config config = argc == 2 ? loadConfig(argv[1]) : Config{};
    applyLogging(config.logging);

    server::ToolServer server("meshtools", MESHTOOLS_VERSION);
    server::registerMeshTools(server, createMeshEngine(config.engine), config);
    server.run(std::cin, std::cout);
  } catch (const std::exception& e) {
    spdlog::error("{}", e.what());
    return 1;
  }

  return 0;
}
