// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * cleaning.hpp
 *
 * Topological clean-up of indexed triangle meshes on top of Open3D:
 * duplicate faces and vertices, unreferenced vertices and small connected
 * components. Face colors follow the faces that survive.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef MESHTOOLS_PROCESSING_CLEANING_HPP
#define MESHTOOLS_PROCESSING_CLEANING_HPP

#include <vector>

#include "meshtools/mesh.hpp"

namespace meshtools {
namespace processing {

/**
 * @brief Removes faces repeating an earlier face's vertex cycle.
 *
 * (0,1,2), (1,2,0) and (2,0,1) are the same face; (0,2,1) has the opposite
 * winding and is kept. The first occurrence survives.
 * @return Number of faces removed
 */
size_t removeDuplicateFaces(TriangleMesh& mesh);

/**
 * @brief Merges vertices with bit-identical positions.
 *
 * Faces are re-indexed to the first occurrence, faces that collapse to an
 * edge or point are dropped, and vertices no longer referenced by any face
 * are removed (meshes only; point clouds keep every distinct point).
 *
 * @return Number of vertices removed
 */
size_t removeDuplicateVertices(TriangleMesh& mesh);

/// Removes vertices not used by any face. No-op on point clouds.
size_t removeUnreferencedVertices(TriangleMesh& mesh);

/// Removes faces with a repeated vertex index.
size_t removeDegenerateFaces(TriangleMesh& mesh);

/**
 * @brief Labels faces by edge-connected component.
 *
 * Labels are numbered in order of each component's first face.
 * @param[out] num_components Number of distinct labels
 * @return Component label (0..num_components-1) per face
 */
std::vector<int> labelFaceComponents(const TriangleMesh& mesh,
                                     int& num_components);

/**
 * @brief Drops edge-connected components with fewer than min_faces faces,
 * then the vertices they leave unreferenced.
 * @return Number of faces removed
 */
size_t removeSmallComponents(TriangleMesh& mesh, int min_faces);

}  // namespace processing
}  // namespace meshtools

#endif  // MESHTOOLS_PROCESSING_CLEANING_HPP
