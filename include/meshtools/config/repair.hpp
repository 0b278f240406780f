// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef MESHTOOLS_CONFIG_REPAIR_HPP
#define MESHTOOLS_CONFIG_REPAIR_HPP

namespace meshtools {
namespace config {

/// Steps of the all-in-one repair pipeline (run in declaration order).
struct Repair {
  bool remove_duplicates = true;  ///< Duplicate faces, then vertices

  bool fill_holes = true;
  int max_hole_size = 30;               ///< Max boundary edges per hole
  bool self_intersection_guard = true;  ///< Reject folded-over patches

  bool reorient_normals = true;  ///< Coherent, outward-facing orientation

  bool remove_small_components = true;
  int min_component_size = 25;  ///< Faces needed for a component to survive
};

}  // namespace config
}  // namespace meshtools

#endif  // MESHTOOLS_CONFIG_REPAIR_HPP
