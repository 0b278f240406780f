// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

#ifndef MESHTOOLS_IO_SAVE_OPTIONS_HPP
#define MESHTOOLS_IO_SAVE_OPTIONS_HPP

namespace meshtools {

/// Channels written when the output format supports them.
struct SaveOptions {
  bool save_vertex_color = true;
  bool save_face_color = true;
  bool save_normals = true;
  bool binary = true;  ///< PLY/STL/PCD: binary encoding instead of ASCII
};

}  // namespace meshtools

#endif  // MESHTOOLS_IO_SAVE_OPTIONS_HPP
