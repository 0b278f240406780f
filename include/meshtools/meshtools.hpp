// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * meshtools.hpp
 *
 * MeshTools: mesh loading, repair and scan alignment behind a session API.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef MESHTOOLS_MESHTOOLS_HPP
#define MESHTOOLS_MESHTOOLS_HPP

// Configs
#include "meshtools/config/meshtools.hpp"

// Data types
#include "meshtools/alignment/rigid_transform.hpp"
#include "meshtools/mesh.hpp"

// Core objects
#include "meshtools/alignment/alignment.hpp"
#include "meshtools/batch/batch.hpp"
#include "meshtools/engine/mesh_engine.hpp"
#include "meshtools/repair/repair.hpp"
#include "meshtools/session/mesh_session.hpp"

#endif  // MESHTOOLS_MESHTOOLS_HPP
