// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * point_types.hpp
 *
 * Point cloud type aliases for meshtools.
 */

#ifndef MESHTOOLS_POINT_TYPES_HPP
#define MESHTOOLS_POINT_TYPES_HPP

#include <nanopcl/core.hpp>

namespace meshtools {

using PointCloud = nanopcl::PointCloud;
using Point = nanopcl::Point;

}  // namespace meshtools

#endif  // MESHTOOLS_POINT_TYPES_HPP
