// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * cloud_convert.hpp
 *
 * Conversions between TriangleMesh vertices and nanoPCL point clouds.
 * Faces are not represented in a PointCloud and are dropped / left empty.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef MESHTOOLS_IO_CLOUD_CONVERT_HPP
#define MESHTOOLS_IO_CLOUD_CONVERT_HPP

#include <vector>

#include "meshtools/mesh.hpp"
#include "meshtools/point_types.hpp"

namespace meshtools {

/// All vertices (with normals and colors when present).
PointCloud toPointCloud(const TriangleMesh& mesh);

/// Subset of vertices given by index.
PointCloud toPointCloud(const TriangleMesh& mesh,
                        const std::vector<size_t>& indices);

/// Point cloud → face-less mesh (normals and colors preserved).
TriangleMesh fromPointCloud(const PointCloud& cloud);

}  // namespace meshtools

#endif  // MESHTOOLS_IO_CLOUD_CONVERT_HPP
