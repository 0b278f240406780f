// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * serialization.hpp
 *
 * nlohmann::json conversions for result types (found through ADL).
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef MESHTOOLS_SERVER_SERIALIZATION_HPP
#define MESHTOOLS_SERVER_SERIALIZATION_HPP

#include <nlohmann/json.hpp>

#include "meshtools/alignment/alignment.hpp"
#include "meshtools/batch/batch.hpp"
#include "meshtools/repair/repair.hpp"
#include "meshtools/session/mesh_session.hpp"

namespace meshtools {

/// 4x4 row-major nested array
void to_json(nlohmann::json& j, const RigidTransform& transform);

void to_json(nlohmann::json& j, const BoundingBox& bbox);
void to_json(nlohmann::json& j, const MeshInfo& info);

void to_json(nlohmann::json& j, const IcpResult& result);
void to_json(nlohmann::json& j, const PointBasedResult& result);
void to_json(nlohmann::json& j, const PairwiseAlignment& arc);
void to_json(nlohmann::json& j, const GlobalAlignResult& result);

void to_json(nlohmann::json& j, const NormalsReport& report);
/// Only the steps that ran appear as keys
void to_json(nlohmann::json& j, const RepairReport& report);

void to_json(nlohmann::json& j, const BatchRecord& record);
void to_json(nlohmann::json& j, const BatchSummary& summary);

/// [[sx, sy, sz], [tx, ty, tz]]
void from_json(const nlohmann::json& j, PointCorrespondence& pair);

}  // namespace meshtools

#endif  // MESHTOOLS_SERVER_SERIALIZATION_HPP
