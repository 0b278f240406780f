// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * test_hole_filling.cpp
 *
 * Tests for boundary loop extraction and ear-clipping hole closure.
 */

#include <gtest/gtest.h>

#include "meshtools/processing/hole_filling.hpp"
#include "meshtools/processing/normals.hpp"
#include "mesh_fixtures.hpp"

using namespace meshtools;
using namespace meshtools::processing;

// ─── Boundary loops ──────────────────────────────────────────────────────────

TEST(BoundaryLoopTest, ClosedMeshHasNone) {
  EXPECT_TRUE(findBoundaryLoops(test::makeCube()).empty());
}

TEST(BoundaryLoopTest, OpenBoxHasOneSquare) {
  const auto loops = findBoundaryLoops(test::makeOpenBox());
  ASSERT_EQ(loops.size(), 1u);
  ASSERT_EQ(loops[0].size(), 4u);

  // Top rim: vertices 4..7
  for (int v : loops[0]) {
    EXPECT_GE(v, 4);
    EXPECT_LE(v, 7);
  }
}

TEST(BoundaryLoopTest, GridHasOuterRim) {
  const auto loops = findBoundaryLoops(test::makeWavySurface(6));
  ASSERT_EQ(loops.size(), 1u);
  EXPECT_EQ(loops[0].size(), 20u);  // 4 * (6 - 1)
}

// ─── Filling ─────────────────────────────────────────────────────────────────

TEST(FillHolesTest, ClosesOpenBox) {
  auto mesh = test::makeOpenBox(2.0);
  EXPECT_EQ(fillHoles(mesh, 30, true), 1u);
  EXPECT_EQ(mesh.faceCount(), 12u);
  EXPECT_TRUE(findBoundaryLoops(mesh).empty());

  // Patch winds with the rest of the surface: volume of a closed 2³ cube
  EXPECT_NEAR(signedVolume(mesh), 8.0, 1e-9);
}

TEST(FillHolesTest, RespectsMaxHoleSize) {
  auto mesh = test::makeOpenBox();
  EXPECT_EQ(fillHoles(mesh, 3, true), 0u);
  EXPECT_EQ(mesh.faceCount(), 10u);
}

TEST(FillHolesTest, PatchFacesGetDefaultColor) {
  auto mesh = test::makeOpenBox();
  mesh.face_colors.assign(mesh.faceCount(), Color{10, 20, 30, 255});

  fillHoles(mesh, 30, true);
  ASSERT_TRUE(mesh.hasFaceColors());
  EXPECT_EQ(mesh.face_colors.back(), Color{});
  EXPECT_EQ(mesh.face_colors.front(), (Color{10, 20, 30, 255}));
}

TEST(FillHolesTest, ConcaveHoleWithGuard) {
  // Flat L-shaped hole in z = 0, ringed by a strip scaled about a kernel point
  TriangleMesh mesh;
  const std::vector<Eigen::Vector3d> inner = {
      {0, 0, 0}, {2, 0, 0}, {2, 1, 0}, {1, 1, 0}, {1, 2, 0}, {0, 2, 0}};
  const Eigen::Vector3d c(0.5, 0.5, 0.0);

  const int n = static_cast<int>(inner.size());
  for (const auto& p : inner) mesh.vertices.push_back(p);
  for (const auto& p : inner) mesh.vertices.push_back(c + 3.0 * (p - c));
  for (int i = 0; i < n; ++i) {
    const int j = (i + 1) % n;
    mesh.faces.emplace_back(i, n + i, n + j);
    mesh.faces.emplace_back(i, n + j, j);
  }
  ASSERT_EQ(findBoundaryLoops(mesh).size(), 2u);  // L hole and outer rim

  const size_t before = mesh.faceCount();
  EXPECT_EQ(fillHoles(mesh, 6, true), 2u);
  ASSERT_EQ(mesh.faceCount(), before + 8u);

  // The L patch covers exactly the L (area 3) and faces up like the ring
  double area = 0.0;
  for (size_t i = before; i < mesh.faceCount(); ++i) {
    const auto& f = mesh.faces[i];
    if (f.maxCoeff() >= n) continue;
    const Eigen::Vector3d cross =
        (mesh.vertices[f[1]] - mesh.vertices[f[0]])
            .cross(mesh.vertices[f[2]] - mesh.vertices[f[0]]);
    EXPECT_GT(cross.z(), 0.0);
    area += 0.5 * cross.norm();
  }
  EXPECT_NEAR(area, 3.0, 1e-9);
}

TEST(FillHolesTest, PointCloudIsNoOp) {
  auto cloud = test::makeSpherePoints(20);
  EXPECT_EQ(fillHoles(cloud, 30, true), 0u);
}
