// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * open3d_convert.hpp
 *
 * Conversions between TriangleMesh and Open3D geometry. Open3D stores
 * vertex colors as RGB in [0, 1]: alpha is not carried and comes back as
 * 255. Face colors have no Open3D counterpart and are left to the caller.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef MESHTOOLS_IO_OPEN3D_CONVERT_HPP
#define MESHTOOLS_IO_OPEN3D_CONVERT_HPP

#include <open3d/geometry/PointCloud.h>
#include <open3d/geometry/TriangleMesh.h>

#include "meshtools/mesh.hpp"

namespace meshtools {

/// Vertices, faces, normals and vertex colors.
open3d::geometry::TriangleMesh toOpen3DMesh(const TriangleMesh& mesh);

/// Vertices, normals and vertex colors (faces dropped).
open3d::geometry::PointCloud toOpen3DCloud(const TriangleMesh& mesh);

/**
 * @brief Open3D mesh → TriangleMesh (no name, no face colors).
 * @throws std::out_of_range if a triangle references a missing vertex
 */
TriangleMesh fromOpen3DMesh(const open3d::geometry::TriangleMesh& mesh);

TriangleMesh fromOpen3DCloud(const open3d::geometry::PointCloud& cloud);

/**
 * @brief Replace the geometry of mesh with the Open3D result.
 *
 * Name is kept. Face colors are kept only if the face count is unchanged;
 * callers that remove faces carry them over themselves.
 */
void assignGeometry(TriangleMesh& mesh,
                    const open3d::geometry::TriangleMesh& result);

/// Route Open3D console output into spdlog (once per process).
void routeOpen3DLogging();

}  // namespace meshtools

#endif  // MESHTOOLS_IO_OPEN3D_CONVERT_HPP
