// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * hole_filling.hpp
 *
 * Boundary loop extraction and ear-clipping hole closure.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef MESHTOOLS_PROCESSING_HOLE_FILLING_HPP
#define MESHTOOLS_PROCESSING_HOLE_FILLING_HPP

#include <vector>

#include "meshtools/mesh.hpp"

namespace meshtools {
namespace processing {

/**
 * @brief Extracts closed boundary loops.
 *
 * A boundary edge is a directed face edge (a→b) whose twin (b→a) does not
 * exist. Loops are returned in hole order (b→a), so triangles built from
 * consecutive loop vertices wind consistently with the surrounding faces.
 * Loops through non-manifold boundary vertices are skipped.
 */
std::vector<std::vector<int>> findBoundaryLoops(const TriangleMesh& mesh);

/**
 * @brief Closes holes bounded by at most max_hole_size edges.
 *
 * Each hole is triangulated by repeatedly clipping the ear with the smallest
 * interior angle. With self_intersection_guard, an ear is accepted only if
 * its normal agrees with the Newell normal of the loop and no other loop
 * vertex lies inside it; a hole where no ear qualifies is left open.
 *
 * @return Number of holes closed
 */
size_t fillHoles(TriangleMesh& mesh, int max_hole_size,
                 bool self_intersection_guard);

}  // namespace processing
}  // namespace meshtools

#endif  // MESHTOOLS_PROCESSING_HOLE_FILLING_HPP
