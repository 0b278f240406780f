// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * normals.hpp
 *
 * Face orientation and per-vertex normals for meshes and point clouds.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef MESHTOOLS_PROCESSING_NORMALS_HPP
#define MESHTOOLS_PROCESSING_NORMALS_HPP

#include "meshtools/mesh.hpp"

namespace meshtools {
namespace processing {

/**
 * @brief Makes face winding consistent within each connected component.
 *
 * Uses Open3D's OrientTriangles, which keeps the first face of each
 * component and propagates across shared edges. A mesh Open3D cannot
 * orient (non-manifold or non-orientable) keeps its winding. With
 * make_outward, an edge-connected component whose signed volume is
 * negative is then flipped as a whole so that its normals point outside.
 *
 * @return Number of faces whose winding changed
 */
size_t orientFaces(TriangleMesh& mesh, bool make_outward);

/// Area-weighted unit vertex normals from face winding (Open3D).
void computeVertexNormals(TriangleMesh& mesh);

/**
 * @brief PCA normals for a point cloud over k nearest neighbors.
 *
 * Normals are oriented away from the cloud centroid.
 */
void estimatePointNormals(TriangleMesh& mesh, int k);

/// Signed volume enclosed by the faces (positive when outward facing).
double signedVolume(const TriangleMesh& mesh);

}  // namespace processing
}  // namespace meshtools

#endif  // MESHTOOLS_PROCESSING_NORMALS_HPP
