// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef MESHTOOLS_CONFIG_MESHTOOLS_HPP
#define MESHTOOLS_CONFIG_MESHTOOLS_HPP

#include <string>

namespace YAML {
class Node;
}

#include "meshtools/config/alignment.hpp"
#include "meshtools/config/batch.hpp"
#include "meshtools/config/engine.hpp"
#include "meshtools/config/repair.hpp"
#include "meshtools/io/save_options.hpp"

namespace meshtools {

namespace config {

/// Logger verbosity (trace|debug|info|warn|error|off).
struct Logging {
  std::string level = "info";
};

}  // namespace config

/// Top-level configuration for sessions, batch runs and the tool server.
struct Config {
  config::Engine engine;
  config::Icp icp;
  config::GlobalAlignment global_alignment;
  config::Repair repair;
  config::Batch batch;
  SaveOptions save;
  config::Logging logging;
};

Config parseConfig(const YAML::Node& root);
Config loadConfig(const std::string& path);

/// Apply logging.level to the default spdlog logger.
void applyLogging(const config::Logging& cfg);

}  // namespace meshtools

#endif  // MESHTOOLS_CONFIG_MESHTOOLS_HPP
