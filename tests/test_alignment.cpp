// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * test_alignment.cpp
 *
 * Tests for ICP, point-based and multi-view alignment on session meshes.
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>

#include "meshtools/alignment/alignment.hpp"
#include "meshtools/engine/mesh_engine.hpp"
#include "mesh_fixtures.hpp"

using namespace meshtools;

namespace {

MeshSession makeSession() { return MeshSession(createMeshEngine({})); }

TriangleMesh moved(TriangleMesh mesh, const Eigen::Isometry3d& T) {
  mesh.transform(T);
  return mesh;
}

double maxVertexDistance(const TriangleMesh& a, const TriangleMesh& b) {
  double worst = 0.0;
  for (size_t i = 0; i < a.vertexCount(); ++i) {
    worst = std::max(worst, (a.vertices[i] - b.vertices[i]).norm());
  }
  return worst;
}

config::Icp denseIcp() {
  config::Icp params;
  params.sample_number = 2000;
  params.max_iterations = 100;
  params.max_distance_fraction = 0.1;
  return params;
}

}  // namespace

// ─── ICP ─────────────────────────────────────────────────────────────────────

TEST(AlignIcpTest, RecoversSmallMotion) {
  auto session = makeSession();
  const auto surface = test::makeWavySurface();
  const int target = session.addMesh(surface);
  const int source = session.addMesh(moved(surface, test::smallMotion()));

  const auto result = alignIcp(session, source, target, denseIcp());

  EXPECT_EQ(result.source_mesh_id, source);
  EXPECT_EQ(result.target_mesh_id, target);
  EXPECT_GT(result.iterations_performed, 0u);
  EXPECT_GT(result.fitness, 0.9);
  EXPECT_LT(result.final_rms_error, 1e-2);
  EXPECT_LT(maxVertexDistance(session.mesh(source), surface), 2e-2);

  // Transform applied is the inverse of the perturbation
  const Eigen::Matrix4d expected = test::smallMotion().inverse().matrix();
  EXPECT_TRUE(result.transform.matrix().isApprox(expected, 1e-2));
}

TEST(AlignIcpTest, TargetIsNotModified) {
  auto session = makeSession();
  const auto surface = test::makeWavySurface(20);
  const int target = session.addMesh(surface);
  const int source = session.addMesh(moved(surface, test::smallMotion()));

  alignIcp(session, source, target, denseIcp());
  EXPECT_EQ(maxVertexDistance(session.mesh(target), surface), 0.0);
  EXPECT_EQ(session.currentMeshId(), source);
}

TEST(AlignIcpTest, SameMeshThrows) {
  auto session = makeSession();
  const int id = session.addMesh(test::makeCube());
  EXPECT_THROW(alignIcp(session, id, id), std::invalid_argument);
}

TEST(AlignIcpTest, UnknownIdThrows) {
  auto session = makeSession();
  const int id = session.addMesh(test::makeCube());
  EXPECT_THROW(alignIcp(session, id, 7), std::out_of_range);
}

TEST(AlignIcpTest, GateScalesWithTarget) {
  config::Icp params;
  params.max_distance_fraction = 0.5;
  const auto settings = icpSettings(params, test::makeCube(2.0));
  EXPECT_NEAR(settings.max_correspondence_distance, 0.5 * std::sqrt(12.0), 1e-12);
  EXPECT_EQ(settings.sample_number, params.sample_number);
}

// ─── Point-based ─────────────────────────────────────────────────────────────

TEST(AlignPointBasedTest, ExactPairsRecoverTransform) {
  auto session = makeSession();
  const auto cube = test::makeCube();
  const auto T = test::smallMotion();
  const int target = session.addMesh(cube);
  const int source = session.addMesh(moved(cube, T));

  std::vector<PointCorrespondence> pairs;
  for (int i : {0, 2, 5, 7}) {
    pairs.push_back({T * cube.vertices[i], cube.vertices[i]});
  }

  const auto result = alignPointBased(session, source, target, pairs);
  EXPECT_EQ(result.method, "point_based");
  EXPECT_EQ(result.pairs_used, 4u);
  EXPECT_FALSE(result.icp.has_value());
  EXPECT_NEAR(result.rms_error, 0.0, 1e-9);
  EXPECT_LT(maxVertexDistance(session.mesh(source), cube), 1e-9);
}

TEST(AlignPointBasedTest, NoPairsFallsBackToIcp) {
  auto session = makeSession();
  const auto surface = test::makeWavySurface(30);
  const int target = session.addMesh(surface);
  const int source = session.addMesh(moved(surface, test::smallMotion()));

  const auto result = alignPointBased(session, source, target, {}, denseIcp());
  EXPECT_EQ(result.method, "icp_fallback");
  EXPECT_EQ(result.pairs_used, 0u);
  ASSERT_TRUE(result.icp.has_value());
  EXPECT_DOUBLE_EQ(result.rms_error, result.icp->final_rms_error);
  EXPECT_LT(maxVertexDistance(session.mesh(source), surface), 2e-2);
}

TEST(AlignPointBasedTest, TooFewPairsLeavesMeshUntouched) {
  auto session = makeSession();
  const auto cube = test::makeCube();
  const int target = session.addMesh(cube);
  const int source = session.addMesh(moved(cube, test::smallMotion()));
  const auto before = session.mesh(source);

  const std::vector<PointCorrespondence> pairs = {
      {cube.vertices[0], cube.vertices[1]},
      {cube.vertices[2], cube.vertices[3]}};
  EXPECT_THROW(alignPointBased(session, source, target, pairs),
               InsufficientCorrespondencesError);
  EXPECT_EQ(maxVertexDistance(session.mesh(source), before), 0.0);
}

TEST(AlignPointBasedTest, CollinearPairsThrow) {
  auto session = makeSession();
  const int target = session.addMesh(test::makeCube());
  const int source = session.addMesh(test::makeCube());

  std::vector<PointCorrespondence> pairs;
  for (int i = 0; i < 4; ++i) {
    const Eigen::Vector3d p(i, 0, 0);
    pairs.push_back({p, p + Eigen::Vector3d(0, 1, 0)});
  }
  EXPECT_THROW(alignPointBased(session, source, target, pairs),
               DegenerateGeometryError);
}

// ─── Global alignment ────────────────────────────────────────────────────────

TEST(GlobalAlignTest, AlignsOverlappingCopies) {
  auto session = makeSession();
  const auto surface = test::makeWavySurface();
  const auto T = test::smallMotion();
  session.addMesh(surface);
  session.addMesh(moved(surface, T));
  session.addMesh(moved(surface, T * T));

  config::GlobalAlignment params;
  params.arc_threshold = 10.0;
  params.sample_number = 1000;
  params.max_iterations = 100;

  const auto result = globalAlign(session, std::nullopt, params);
  EXPECT_EQ(result.base_mesh_id, 0);
  EXPECT_EQ(result.aligned_mesh_ids, (std::vector<int>{0, 1, 2}));
  EXPECT_TRUE(result.unaligned_mesh_ids.empty());
  EXPECT_EQ(result.pairwise.size(), 2u);
  EXPECT_LT(result.global_rms_error, 1e-2);

  for (int id : {1, 2}) {
    EXPECT_LT(maxVertexDistance(session.mesh(id), surface), 2e-2) << "mesh " << id;
  }
}

TEST(GlobalAlignTest, FarMeshStaysUnaligned) {
  auto session = makeSession();
  const auto surface = test::makeWavySurface(20);
  Eigen::Isometry3d far = Eigen::Isometry3d::Identity();
  far.translate(Eigen::Vector3d(100, 0, 0));

  session.addMesh(surface);
  session.addMesh(moved(surface, test::smallMotion()));
  const int lost = session.addMesh(moved(surface, far));
  const auto before = session.mesh(lost);

  config::GlobalAlignment params;
  params.arc_threshold = 10.0;
  const auto result = globalAlign(session, std::nullopt, params);

  EXPECT_EQ(result.aligned_mesh_ids, (std::vector<int>{0, 1}));
  EXPECT_EQ(result.unaligned_mesh_ids, (std::vector<int>{lost}));
  EXPECT_EQ(maxVertexDistance(session.mesh(lost), before), 0.0);

  // Rejected arcs report an identity transform
  for (const auto& arc : result.pairwise) {
    if (arc.mesh_id != lost) continue;
    EXPECT_FALSE(arc.accepted);
    EXPECT_TRUE(arc.transform.matrix().isIdentity());
  }
}

TEST(GlobalAlignTest, SubsetOfMeshes) {
  auto session = makeSession();
  const auto surface = test::makeWavySurface(20);
  session.addMesh(test::makeCube(1.0, Eigen::Vector3d(50, 50, 50)));
  const int a = session.addMesh(surface);
  const int b = session.addMesh(moved(surface, test::smallMotion()));

  config::GlobalAlignment params;
  params.arc_threshold = 10.0;
  const auto result = globalAlign(session, std::vector<int>{a, b}, params);
  EXPECT_EQ(result.base_mesh_id, a);
  EXPECT_EQ(result.aligned_mesh_ids, (std::vector<int>{a, b}));
}

TEST(GlobalAlignTest, NeedsTwoMeshes) {
  auto session = makeSession();
  session.addMesh(test::makeCube());
  EXPECT_THROW(globalAlign(session, std::nullopt), std::invalid_argument);
  EXPECT_THROW(globalAlign(session, std::vector<int>{0}), std::invalid_argument);
  EXPECT_THROW(globalAlign(session, std::vector<int>{0, 9}), std::out_of_range);
}

TEST(GlobalAlignTest, RepeatedIdsRejected) {
  auto session = makeSession();
  session.addMesh(test::makeWavySurface(10));
  session.addMesh(test::makeWavySurface(10));
  const auto before = session.mesh(1).vertices;

  EXPECT_THROW(globalAlign(session, std::vector<int>{0, 1, 1}),
               std::invalid_argument);
  EXPECT_THROW(globalAlign(session, std::vector<int>{0, 1, 0}),
               std::invalid_argument);
  EXPECT_EQ(session.mesh(1).vertices, before);
}
