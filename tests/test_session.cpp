// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * test_session.cpp
 *
 * Tests for MeshSession bookkeeping and the engine factory.
 */

#include <gtest/gtest.h>

#include "meshtools/engine/builtin_engine.hpp"
#include "meshtools/io/mesh_io.hpp"
#include "meshtools/session/mesh_session.hpp"
#include "mesh_fixtures.hpp"

using namespace meshtools;

namespace {

MeshSession makeSession() { return MeshSession(createMeshEngine({})); }

}  // namespace

// ─── Engine factory ──────────────────────────────────────────────────────────

TEST(CreateMeshEngineTest, BuiltinByDefault) {
  auto engine = createMeshEngine(config::Engine{});
  ASSERT_NE(engine, nullptr);
  EXPECT_EQ(engine->name(), "builtin");
  EXPECT_TRUE(engine->canRead("a.ply"));
  EXPECT_FALSE(engine->canRead("a.dae"));
}

TEST(CreateMeshEngineTest, UnhandledTypeThrows) {
  config::Engine cfg;
  cfg.type = static_cast<EngineType>(42);
  EXPECT_THROW(createMeshEngine(cfg), std::invalid_argument);
}

TEST(CreateMeshEngineTest, RegisterIcpRejectsBadInput) {
  auto engine = createMeshEngine({});
  IcpSettings settings;
  settings.max_correspondence_distance = 0.1;

  EXPECT_THROW(engine->registerIcp(TriangleMesh{}, test::makeCube(), settings),
               std::invalid_argument);

  settings.max_correspondence_distance = 0.0;
  EXPECT_THROW(engine->registerIcp(test::makeCube(), test::makeCube(), settings),
               std::invalid_argument);
}

// ─── Construction ────────────────────────────────────────────────────────────

TEST(MeshSessionTest, NullEngineThrows) {
  EXPECT_THROW(MeshSession(nullptr), std::invalid_argument);
}

TEST(MeshSessionTest, StartsEmpty) {
  auto session = makeSession();
  EXPECT_EQ(session.meshCount(), 0u);
  EXPECT_FALSE(session.currentMeshId().has_value());
  EXPECT_THROW(session.currentMesh(), std::runtime_error);
  EXPECT_THROW(session.meshInfo(), std::runtime_error);
}

// ─── Ids and selection ───────────────────────────────────────────────────────

TEST(MeshSessionTest, IdsAreSequentialAndLastIsCurrent) {
  auto session = makeSession();
  EXPECT_EQ(session.addMesh(test::makeCube()), 0);
  EXPECT_EQ(session.addMesh(test::makeOpenBox()), 1);
  EXPECT_EQ(session.currentMeshId(), 1);
  EXPECT_EQ(session.currentMesh().name, "open_box");
  EXPECT_EQ(session.meshIds(), (std::vector<int>{0, 1}));
}

TEST(MeshSessionTest, SetActiveMesh) {
  auto session = makeSession();
  session.addMesh(test::makeCube());
  session.addMesh(test::makeOpenBox());

  session.setActiveMesh(0);
  EXPECT_EQ(session.currentMesh().name, "cube");
  EXPECT_THROW(session.setActiveMesh(5), std::out_of_range);
  EXPECT_EQ(session.currentMeshId(), 0);
}

TEST(MeshSessionTest, SelectWithoutIdKeepsCurrent) {
  auto session = makeSession();
  session.addMesh(test::makeCube());
  session.addMesh(test::makeOpenBox());
  session.setActiveMesh(0);

  EXPECT_EQ(session.select(std::nullopt).name, "cube");
  EXPECT_EQ(session.select(1).name, "open_box");
  EXPECT_EQ(session.currentMeshId(), 1);
}

TEST(MeshSessionTest, DeleteKeepsOtherIdsStable) {
  auto session = makeSession();
  session.addMesh(test::makeCube());
  session.addMesh(test::makeOpenBox());
  session.addMesh(test::makeWavySurface(5));

  session.setActiveMesh(1);
  session.deleteMesh(1);
  EXPECT_EQ(session.meshIds(), (std::vector<int>{0, 2}));
  EXPECT_EQ(session.currentMeshId(), 2);
  EXPECT_EQ(session.mesh(2).name, "wavy");

  // Ids are never reused
  EXPECT_EQ(session.addMesh(test::makeCube()), 3);
  EXPECT_THROW(session.deleteMesh(1), std::out_of_range);
  EXPECT_THROW(session.mesh(1), std::out_of_range);
}

TEST(MeshSessionTest, DeletingLastMeshClearsCurrent) {
  auto session = makeSession();
  session.addMesh(test::makeCube());
  session.deleteMesh(0);
  EXPECT_FALSE(session.currentMeshId().has_value());
  EXPECT_EQ(session.meshCount(), 0u);
}

// ─── Info ────────────────────────────────────────────────────────────────────

TEST(MeshSessionTest, MeshInfoReportsCountsAndBox) {
  auto session = makeSession();
  session.addMesh(test::makeCube(2.0));

  const auto info = session.meshInfo();
  EXPECT_EQ(info.mesh_id, 0);
  EXPECT_EQ(info.name, "cube");
  EXPECT_EQ(info.vertex_count, 8u);
  EXPECT_EQ(info.face_count, 12u);
  EXPECT_TRUE(info.bounding_box.min.isApprox(Eigen::Vector3d(-1, -1, -1)));
  EXPECT_TRUE(info.bounding_box.max.isApprox(Eigen::Vector3d(1, 1, 1)));
}

TEST(MeshSessionTest, ListMeshesPreservesCurrent) {
  auto session = makeSession();
  session.addMesh(test::makeCube());
  session.addMesh(test::makeOpenBox());
  session.setActiveMesh(0);

  const auto infos = session.listMeshes();
  ASSERT_EQ(infos.size(), 2u);
  EXPECT_EQ(infos[1].face_count, 10u);
  EXPECT_EQ(session.currentMeshId(), 0);
}

// ─── Files ───────────────────────────────────────────────────────────────────

TEST(MeshSessionTest, LoadAndSaveThroughEngine) {
  const auto dir = test::makeTempDir("session_files");
  const auto input = (dir / "part.ply").string();
  io::saveMesh(input, test::makeCube());

  auto session = makeSession();
  const int id = session.loadMesh(input);
  EXPECT_EQ(session.mesh(id).name, "part");

  // Parent directories are created on save
  const auto output = (dir / "nested" / "deeper" / "part.obj").string();
  session.saveMesh(output, id);
  EXPECT_TRUE(std::filesystem::exists(output));
  EXPECT_EQ(io::loadMesh(output).faceCount(), 12u);
}

TEST(MeshSessionTest, LoadFailureLeavesSessionUnchanged) {
  auto session = makeSession();
  session.addMesh(test::makeCube());

  EXPECT_THROW(session.loadMesh("/nonexistent/file.ply"), io::MeshIOError);
  EXPECT_EQ(session.meshCount(), 1u);
  EXPECT_EQ(session.currentMeshId(), 0);
}

TEST(MeshSessionTest, SaveUnknownIdThrows) {
  auto session = makeSession();
  EXPECT_THROW(session.saveMesh("/tmp/x.ply", 3), std::out_of_range);
}
