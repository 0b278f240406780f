// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * test_config.cpp
 *
 * Tests for YAML configuration loading and validation.
 */

#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>

#include <fstream>

#include "meshtools/config/meshtools.hpp"

using namespace meshtools;

// ─── Helpers ─────────────────────────────────────────────────────────────────

namespace {

/// Write a temporary YAML file and return its path.
std::string writeTempYaml(const std::string& content,
                          const std::string& name = "meshtools_config.yaml") {
  std::string path = "/tmp/" + name;
  std::ofstream fs(path);
  fs << content;
  return path;
}

Config parse(const std::string& yaml) { return parseConfig(YAML::Load(yaml)); }

}  // namespace

// ─── Loading Tests ───────────────────────────────────────────────────────────

TEST(ConfigLoadTest, LoadDefaultYaml) {
  // The shipped default.yaml matches the compiled-in defaults
  auto cfg = loadConfig(MESHTOOLS_CONFIG_DIR "/default.yaml");
  Config defaults;

  EXPECT_EQ(cfg.engine.type, EngineType::Builtin);
  EXPECT_EQ(cfg.engine.normal_neighbors, defaults.engine.normal_neighbors);
  EXPECT_EQ(cfg.icp.sample_number, defaults.icp.sample_number);
  EXPECT_DOUBLE_EQ(cfg.icp.max_distance_fraction,
                   defaults.icp.max_distance_fraction);
  EXPECT_DOUBLE_EQ(cfg.global_alignment.arc_threshold,
                   defaults.global_alignment.arc_threshold);
  EXPECT_EQ(cfg.repair.max_hole_size, defaults.repair.max_hole_size);
  EXPECT_EQ(cfg.repair.min_component_size, defaults.repair.min_component_size);
  EXPECT_EQ(cfg.batch.output_format, ".ply");
  EXPECT_TRUE(cfg.save.binary);
  EXPECT_EQ(cfg.logging.level, "info");
}

TEST(ConfigLoadTest, NonexistentFileThrows) {
  EXPECT_THROW(loadConfig("/nonexistent/path.yaml"), std::runtime_error);
}

TEST(ConfigLoadTest, MalformedYamlThrows) {
  auto path = writeTempYaml("icp: [unclosed\n", "meshtools_bad.yaml");
  EXPECT_THROW(loadConfig(path), std::runtime_error);
}

TEST(ConfigLoadTest, EmptyYamlUsesDefaults) {
  auto path = writeTempYaml("# empty config\n", "meshtools_empty.yaml");
  auto cfg = loadConfig(path);

  Config defaults;
  EXPECT_EQ(cfg.icp.max_iterations, defaults.icp.max_iterations);
  EXPECT_EQ(cfg.repair.fill_holes, defaults.repair.fill_holes);
  EXPECT_EQ(cfg.batch.recursive, defaults.batch.recursive);
}

TEST(ConfigLoadTest, PartialYamlPreservesDefaults) {
  auto cfg = parse(
      "repair:\n"
      "  max_hole_size: 12\n"
      "  fill_holes: false\n"
      "save:\n"
      "  binary: false\n");

  EXPECT_EQ(cfg.repair.max_hole_size, 12);
  EXPECT_FALSE(cfg.repair.fill_holes);
  EXPECT_FALSE(cfg.save.binary);

  Config defaults;
  EXPECT_EQ(cfg.repair.min_component_size, defaults.repair.min_component_size);
  EXPECT_EQ(cfg.save.save_normals, defaults.save.save_normals);
  EXPECT_EQ(cfg.icp.sample_number, defaults.icp.sample_number);
}

TEST(ConfigLoadTest, UnknownEngineFallsBackToBuiltin) {
  auto cfg = parse("engine:\n  type: pymeshlab\n");
  EXPECT_EQ(cfg.engine.type, EngineType::Builtin);
}

TEST(ConfigLoadTest, WrongTypeThrows) {
  EXPECT_THROW(parse("icp:\n  max_iterations: many\n"), YAML::Exception);
}

// ─── Validation Tests ────────────────────────────────────────────────────────

TEST(ConfigValidationTest, EmptyOutputFormatThrows) {
  EXPECT_THROW(parse("batch:\n  output_format: \"\"\n"), std::invalid_argument);
  EXPECT_THROW(parse("batch:\n  output_format: .\n"), std::invalid_argument);
}

TEST(ConfigValidationTest, OutputFormatGetsDot) {
  EXPECT_EQ(parse("batch:\n  output_format: obj\n").batch.output_format, ".obj");
}

TEST(ConfigValidationTest, ClampsIntegers) {
  auto cfg = parse(
      "engine:\n  normal_neighbors: 1\n"
      "icp:\n  sample_number: 0\n  max_iterations: -4\n"
      "repair:\n  max_hole_size: 2\n  min_component_size: 0\n");

  EXPECT_EQ(cfg.engine.normal_neighbors, 3);
  EXPECT_EQ(cfg.icp.sample_number, 3);
  EXPECT_EQ(cfg.icp.max_iterations, 1);
  EXPECT_EQ(cfg.repair.max_hole_size, 3);
  EXPECT_EQ(cfg.repair.min_component_size, 1);
}

TEST(ConfigValidationTest, NonPositiveDistancesFallBack) {
  auto cfg = parse(
      "icp:\n  max_distance_fraction: 0\n"
      "global_alignment:\n  arc_threshold: -2\n");
  EXPECT_DOUBLE_EQ(cfg.icp.max_distance_fraction, 0.01);
  EXPECT_DOUBLE_EQ(cfg.global_alignment.arc_threshold, 1.0);
}

TEST(ConfigValidationTest, MinOverlapClampedToUnitRange) {
  EXPECT_DOUBLE_EQ(
      parse("global_alignment:\n  min_overlap: 1.5\n").global_alignment.min_overlap,
      1.0);
  EXPECT_DOUBLE_EQ(
      parse("global_alignment:\n  min_overlap: -0.2\n").global_alignment.min_overlap,
      0.0);
}

TEST(ConfigValidationTest, LoggingLevel) {
  EXPECT_EQ(parse("logging:\n  level: DEBUG\n").logging.level, "debug");
  EXPECT_EQ(parse("logging:\n  level: off\n").logging.level, "off");
  EXPECT_EQ(parse("logging:\n  level: loud\n").logging.level, "info");
}
