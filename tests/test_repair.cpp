// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * test_repair.cpp
 *
 * Tests for the session-level repair steps and the combined pipeline.
 */

#include <gtest/gtest.h>

#include "meshtools/engine/mesh_engine.hpp"
#include "meshtools/processing/hole_filling.hpp"
#include "meshtools/processing/normals.hpp"
#include "meshtools/repair/repair.hpp"
#include "mesh_fixtures.hpp"

using namespace meshtools;

namespace {

MeshSession makeSession() { return MeshSession(createMeshEngine({})); }

/// Open box (size 2) with a repeated face, one unwelded corner and a small
/// closed tetrahedron floating away from it.
TriangleMesh makeDamagedBox() {
  auto mesh = test::makeOpenBox(2.0);
  mesh.faces.push_back(mesh.faces[0]);

  mesh.vertices.push_back(mesh.vertices[1]);  // 8: copy of corner 1
  mesh.faces[8] = Face(8, 2, 6);

  const Eigen::Vector3d o(10, 10, 10);
  mesh.vertices.push_back(o);                              // 9
  mesh.vertices.push_back(o + Eigen::Vector3d(1, 0, 0));   // 10
  mesh.vertices.push_back(o + Eigen::Vector3d(0, 1, 0));   // 11
  mesh.vertices.push_back(o + Eigen::Vector3d(0, 0, 1));   // 12
  mesh.faces.emplace_back(9, 11, 10);
  mesh.faces.emplace_back(9, 10, 12);
  mesh.faces.emplace_back(9, 12, 11);
  mesh.faces.emplace_back(10, 11, 12);
  return mesh;
}

config::Repair allSteps() {
  config::Repair options;
  options.min_component_size = 5;
  return options;
}

}  // namespace

// ─── Full pipeline ───────────────────────────────────────────────────────────

TEST(RepairMeshTest, FixesDamagedBox) {
  auto session = makeSession();
  const int id = session.addMesh(makeDamagedBox());

  const auto report = repairMesh(session, id, allSteps());

  ASSERT_TRUE(report.duplicate_faces.has_value());
  EXPECT_EQ(*report.duplicate_faces, 1u);
  ASSERT_TRUE(report.duplicate_vertices.has_value());
  EXPECT_EQ(*report.duplicate_vertices, 1u);
  ASSERT_TRUE(report.holes_filled.has_value());
  EXPECT_EQ(*report.holes_filled, 1u);
  ASSERT_TRUE(report.normals.has_value());
  EXPECT_EQ(report.normals->status, "ok");
  EXPECT_EQ(report.normals->flipped_faces, 0u);
  EXPECT_FALSE(report.normals->point_cloud);
  ASSERT_TRUE(report.isolated_pieces.has_value());
  EXPECT_EQ(*report.isolated_pieces, 4u);

  // What is left is the closed, outward 2³ cube
  const auto& mesh = session.mesh(id);
  EXPECT_EQ(mesh.vertexCount(), 8u);
  EXPECT_EQ(mesh.faceCount(), 12u);
  EXPECT_TRUE(processing::findBoundaryLoops(mesh).empty());
  EXPECT_NEAR(processing::signedVolume(mesh), 8.0, 1e-9);
  EXPECT_TRUE(mesh.hasNormals());
}

TEST(RepairMeshTest, DisabledStepsAreNotReported) {
  auto session = makeSession();
  session.addMesh(makeDamagedBox());
  const auto before = session.currentMesh();

  config::Repair options;
  options.remove_duplicates = false;
  options.fill_holes = false;
  options.reorient_normals = false;
  options.remove_small_components = false;

  const auto report = repairMesh(session, std::nullopt, options);
  EXPECT_FALSE(report.duplicate_faces.has_value());
  EXPECT_FALSE(report.duplicate_vertices.has_value());
  EXPECT_FALSE(report.holes_filled.has_value());
  EXPECT_FALSE(report.normals.has_value());
  EXPECT_FALSE(report.isolated_pieces.has_value());

  EXPECT_EQ(session.currentMesh().faceCount(), before.faceCount());
  EXPECT_EQ(session.currentMesh().vertexCount(), before.vertexCount());
}

TEST(RepairMeshTest, DefaultsDropSmallClosedMesh) {
  // A lone 12-face cube is below the default component size
  auto session = makeSession();
  session.addMesh(test::makeCube());
  const auto report = repairMesh(session);
  EXPECT_EQ(*report.isolated_pieces, 12u);
  EXPECT_TRUE(session.currentMesh().empty());
}

TEST(RepairMeshTest, UnknownIdThrows) {
  auto session = makeSession();
  EXPECT_THROW(repairMesh(session, 4), std::out_of_range);
}

// ─── Individual steps ────────────────────────────────────────────────────────

TEST(RepairStepsTest, OperateOnCurrentMesh) {
  auto session = makeSession();
  const int box = session.addMesh(test::makeOpenBox());
  session.addMesh(test::makeCube());
  session.setActiveMesh(box);

  EXPECT_EQ(fillHoles(session), 1u);
  EXPECT_EQ(session.mesh(box).faceCount(), 12u);
  EXPECT_EQ(session.mesh(1).faceCount(), 12u);
}

TEST(RepairStepsTest, SelectingAnIdMakesItCurrent) {
  auto session = makeSession();
  session.addMesh(test::makeCube());
  session.addMesh(test::makeCube());

  auto& mesh = session.mesh(0);
  mesh.faces.push_back(mesh.faces[4]);
  EXPECT_EQ(removeDuplicateFaces(session, 0), 1u);
  EXPECT_EQ(session.currentMeshId(), 0);
}

TEST(RepairStepsTest, FixNormalsTurnsInsideOutCube) {
  auto session = makeSession();
  auto cube = test::makeCube();
  for (auto& f : cube.faces) std::swap(f[1], f[2]);
  session.addMesh(cube);

  const auto report = fixNormals(session);
  EXPECT_EQ(report.flipped_faces, 12u);
  EXPECT_FALSE(report.point_cloud);
  EXPECT_GT(processing::signedVolume(session.currentMesh()), 0.0);
}

TEST(RepairStepsTest, FixNormalsOnPointCloud) {
  auto session = makeSession();
  session.addMesh(test::makeSpherePoints(300));

  const auto report = fixNormals(session);
  EXPECT_TRUE(report.point_cloud);
  EXPECT_EQ(report.flipped_faces, 0u);
  EXPECT_TRUE(session.currentMesh().hasNormals());
}

TEST(RepairStepsTest, PointCloudPipelineOnlyEstimatesNormals) {
  auto session = makeSession();
  session.addMesh(test::makeSpherePoints(300));

  const auto report = repairMesh(session);
  EXPECT_EQ(*report.duplicate_faces, 0u);
  EXPECT_EQ(*report.holes_filled, 0u);
  EXPECT_TRUE(report.normals->point_cloud);
  EXPECT_EQ(*report.isolated_pieces, 0u);
  EXPECT_EQ(session.currentMesh().vertexCount(), 300u);
}
