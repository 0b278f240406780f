// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * alignment.hpp
 *
 * Alignment configuration: pairwise ICP and multi-view registration.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef MESHTOOLS_CONFIG_ALIGNMENT_HPP
#define MESHTOOLS_CONFIG_ALIGNMENT_HPP

namespace meshtools {
namespace config {

/**
 * @brief Point-to-point ICP parameters.
 *
 * The correspondence gate is relative to the target size so the same
 * parameters work for millimeter and meter scale scans.
 */
struct Icp {
  int sample_number = 2000;  ///< Source vertices sampled for registration
  int max_iterations = 75;
  /// Max correspondence distance as a fraction of the target bbox diagonal
  double max_distance_fraction = 0.01;
};

/// Multi-view registration against a fixed base mesh.
struct GlobalAlignment {
  /// Correspondence distance in percent of the base mesh bbox diagonal
  double arc_threshold = 1.0;
  int sample_number = 1000;  ///< Vertices sampled per mesh
  int max_iterations = 75;
  /// Minimum inlier ratio for a pairwise alignment (arc) to be accepted
  double min_overlap = 0.3;
};

}  // namespace config
}  // namespace meshtools

#endif  // MESHTOOLS_CONFIG_ALIGNMENT_HPP
