// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef MESHTOOLS_CONFIG_BATCH_HPP
#define MESHTOOLS_CONFIG_BATCH_HPP

#include <string>

namespace meshtools {
namespace config {

/// Directory processing options.
struct Batch {
  std::string output_format = ".ply";  ///< Extension of written files
  bool recursive = false;  ///< Descend into sub-directories (mirrored)
};

}  // namespace config
}  // namespace meshtools

#endif  // MESHTOOLS_CONFIG_BATCH_HPP
