// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef MESHTOOLS_CONFIG_ENGINE_HPP
#define MESHTOOLS_CONFIG_ENGINE_HPP

#include <cstdint>

namespace meshtools {

/// Mesh engine backend.
enum class EngineType {
  Builtin  ///< Open3D mesh processing + nanoPCL registration
};

namespace config {

struct Engine {
  EngineType type = EngineType::Builtin;
  int normal_neighbors = 10;   ///< k for point cloud normal estimation
  uint32_t sample_seed = 42;   ///< Seed for ICP vertex sampling
};

}  // namespace config
}  // namespace meshtools

#endif  // MESHTOOLS_CONFIG_ENGINE_HPP
