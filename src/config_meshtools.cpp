// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * config_meshtools.cpp
 *
 * YAML configuration loading.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>

#include "meshtools/config/meshtools.hpp"

namespace meshtools {
namespace detail {

template <typename T>
void load(const YAML::Node& node, const std::string& key, T& value) {
  if (node[key]) {
    value = node[key].as<T>();
  }
}

EngineType parseEngineType(const std::string& type) {
  if (type == "builtin") return EngineType::Builtin;
  spdlog::warn("[Config] Unknown engine type '{}', defaulting to builtin",
               type);
  return EngineType::Builtin;
}

Config parse(const YAML::Node& root) {
  Config cfg;

  // Engine
  if (auto n = root["engine"]) {
    std::string type_str;
    load(n, "type", type_str);
    if (!type_str.empty()) cfg.engine.type = parseEngineType(type_str);
    load(n, "normal_neighbors", cfg.engine.normal_neighbors);
    load(n, "sample_seed", cfg.engine.sample_seed);
  }

  // Pairwise ICP
  if (auto n = root["icp"]) {
    load(n, "sample_number", cfg.icp.sample_number);
    load(n, "max_iterations", cfg.icp.max_iterations);
    load(n, "max_distance_fraction", cfg.icp.max_distance_fraction);
  }

  // Multi-view registration
  if (auto n = root["global_alignment"]) {
    auto& g = cfg.global_alignment;
    load(n, "arc_threshold", g.arc_threshold);
    load(n, "sample_number", g.sample_number);
    load(n, "max_iterations", g.max_iterations);
    load(n, "min_overlap", g.min_overlap);
  }

  // Repair pipeline
  if (auto n = root["repair"]) {
    auto& r = cfg.repair;
    load(n, "remove_duplicates", r.remove_duplicates);
    load(n, "fill_holes", r.fill_holes);
    load(n, "max_hole_size", r.max_hole_size);
    load(n, "self_intersection_guard", r.self_intersection_guard);
    load(n, "reorient_normals", r.reorient_normals);
    load(n, "remove_small_components", r.remove_small_components);
    load(n, "min_component_size", r.min_component_size);
  }

  // Batch
  if (auto n = root["batch"]) {
    load(n, "output_format", cfg.batch.output_format);
    load(n, "recursive", cfg.batch.recursive);
  }

  // Output
  if (auto n = root["save"]) {
    load(n, "vertex_color", cfg.save.save_vertex_color);
    load(n, "face_color", cfg.save.save_face_color);
    load(n, "normals", cfg.save.save_normals);
    load(n, "binary", cfg.save.binary);
  }

  if (auto n = root["logging"]) {
    load(n, "level", cfg.logging.level);
  }

  return cfg;
}

void validate(Config& cfg) {
  // --- Fatal: values that make an operation meaningless ---
  if (cfg.batch.output_format.empty() || cfg.batch.output_format == ".") {
    throw std::invalid_argument("batch.output_format must not be empty");
  }
  if (cfg.batch.output_format.front() != '.') {
    cfg.batch.output_format.insert(cfg.batch.output_format.begin(), '.');
  }

  // --- Non-fatal: warn and clamp ---
  auto warn_clamp_min = [](const std::string& name, int& val, int lo) {
    if (val < lo) {
      spdlog::warn("[Config] {} ({}) must be >= {}, clamping", name, val, lo);
      val = lo;
    }
  };
  auto warn_clamp_positive = [](const std::string& name, double& val,
                                double fallback) {
    if (!(val > 0.0)) {
      spdlog::warn("[Config] {} ({}) must be > 0, clamping to {}", name, val,
                   fallback);
      val = fallback;
    }
  };

  warn_clamp_min("engine.normal_neighbors", cfg.engine.normal_neighbors, 3);

  warn_clamp_min("icp.sample_number", cfg.icp.sample_number, 3);
  warn_clamp_min("icp.max_iterations", cfg.icp.max_iterations, 1);
  warn_clamp_positive("icp.max_distance_fraction",
                      cfg.icp.max_distance_fraction, 0.01);

  auto& g = cfg.global_alignment;
  warn_clamp_positive("global_alignment.arc_threshold", g.arc_threshold, 1.0);
  warn_clamp_min("global_alignment.sample_number", g.sample_number, 3);
  warn_clamp_min("global_alignment.max_iterations", g.max_iterations, 1);
  if (g.min_overlap < 0.0 || g.min_overlap > 1.0) {
    spdlog::warn("[Config] global_alignment.min_overlap ({}) out of [0, 1], "
                 "clamping",
                 g.min_overlap);
    g.min_overlap = std::clamp(g.min_overlap, 0.0, 1.0);
  }

  warn_clamp_min("repair.max_hole_size", cfg.repair.max_hole_size, 3);
  warn_clamp_min("repair.min_component_size", cfg.repair.min_component_size,
                 1);

  std::string level = cfg.logging.level;
  std::transform(level.begin(), level.end(), level.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (spdlog::level::from_str(level) == spdlog::level::off && level != "off") {
    spdlog::warn("[Config] Unknown logging.level '{}', defaulting to info",
                 cfg.logging.level);
    level = "info";
  }
  cfg.logging.level = level;
}

}  // namespace detail

Config parseConfig(const YAML::Node& root) {
  auto cfg = detail::parse(root);
  detail::validate(cfg);
  return cfg;
}

Config loadConfig(const std::string& path) {
  try {
    return parseConfig(YAML::LoadFile(path));
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load config: " + path + " - " +
                             e.what());
  }
}

void applyLogging(const config::Logging& cfg) {
  spdlog::set_level(spdlog::level::from_str(cfg.level));
}

}  // namespace meshtools
