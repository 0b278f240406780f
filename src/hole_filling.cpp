// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * hole_filling.cpp
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "meshtools/processing/hole_filling.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <unordered_set>

namespace meshtools {
namespace processing {

namespace {

inline uint64_t edgeKey(int a, int b) {
  return (static_cast<uint64_t>(static_cast<uint32_t>(a)) << 32) |
         static_cast<uint32_t>(b);
}

/// Newell's method: robust normal of a (possibly non-planar) polygon.
Eigen::Vector3d newellNormal(const TriangleMesh& mesh,
                             const std::vector<int>& loop) {
  Eigen::Vector3d n = Eigen::Vector3d::Zero();
  for (size_t i = 0; i < loop.size(); ++i) {
    const auto& a = mesh.vertices[loop[i]];
    const auto& b = mesh.vertices[loop[(i + 1) % loop.size()]];
    n.x() += (a.y() - b.y()) * (a.z() + b.z());
    n.y() += (a.z() - b.z()) * (a.x() + b.x());
    n.z() += (a.x() - b.x()) * (a.y() + b.y());
  }
  return n;
}

/// Interior angle at `cur` between the loop neighbors.
double earAngle(const Eigen::Vector3d& prev, const Eigen::Vector3d& cur,
                const Eigen::Vector3d& next) {
  const Eigen::Vector3d u = prev - cur;
  const Eigen::Vector3d v = next - cur;
  const double denom = u.norm() * v.norm();
  if (denom <= 0.0) return 0.0;
  return std::acos(std::clamp(u.dot(v) / denom, -1.0, 1.0));
}

/// True if p lies inside or on the border of triangle (a, b, c) seen along n.
bool insideTriangle(const Eigen::Vector3d& p, const Eigen::Vector3d& a,
                    const Eigen::Vector3d& b, const Eigen::Vector3d& c,
                    const Eigen::Vector3d& n) {
  const double scale = (b - a).norm() + (c - b).norm() + (a - c).norm();
  const double tol = -1e-9 * scale * scale;
  return (b - a).cross(p - a).dot(n) >= tol &&
         (c - b).cross(p - b).dot(n) >= tol &&
         (a - c).cross(p - c).dot(n) >= tol;
}

/// No other loop vertex may fall inside the ear (prev, cur, next).
bool earIsEmpty(const TriangleMesh& mesh, const std::vector<int>& loop,
                size_t i, const Eigen::Vector3d& n) {
  const size_t count = loop.size();
  const int ia = loop[(i + count - 1) % count];
  const int ib = loop[i];
  const int ic = loop[(i + 1) % count];
  const auto& a = mesh.vertices[ia];
  const auto& b = mesh.vertices[ib];
  const auto& c = mesh.vertices[ic];

  for (int v : loop) {
    if (v == ia || v == ib || v == ic) continue;
    const auto& p = mesh.vertices[v];
    if (p == a || p == b || p == c) continue;
    if (insideTriangle(p, a, b, c, n)) return false;
  }
  return true;
}

/**
 * Ear-clip one loop. Triangles are appended to `out`; returns false when the
 * guard rejects every remaining ear.
 */
bool triangulateLoop(const TriangleMesh& mesh, std::vector<int> loop,
                     bool guard, std::vector<Face>& out) {
  const Eigen::Vector3d normal = newellNormal(mesh, loop);
  const Eigen::Vector3d unit_normal = normal.normalized();

  while (loop.size() >= 3) {
    const size_t n = loop.size();
    double best_angle = std::numeric_limits<double>::max();
    size_t best = n;

    for (size_t i = 0; i < n; ++i) {
      const auto& prev = mesh.vertices[loop[(i + n - 1) % n]];
      const auto& cur = mesh.vertices[loop[i]];
      const auto& next = mesh.vertices[loop[(i + 1) % n]];

      if (guard) {
        const Eigen::Vector3d ear_normal = (cur - prev).cross(next - prev);
        if (ear_normal.dot(normal) <= 0.0) continue;
        if (!earIsEmpty(mesh, loop, i, unit_normal)) continue;
      }

      const double angle = earAngle(prev, cur, next);
      if (angle < best_angle) {
        best_angle = angle;
        best = i;
      }
    }

    if (best == n) return false;

    out.emplace_back(loop[(best + n - 1) % n], loop[best],
                     loop[(best + 1) % n]);
    loop.erase(loop.begin() + static_cast<std::ptrdiff_t>(best));
  }
  return true;
}

}  // namespace

std::vector<std::vector<int>> findBoundaryLoops(const TriangleMesh& mesh) {
  std::unordered_set<uint64_t> directed;
  directed.reserve(mesh.faceCount() * 3);
  for (const auto& f : mesh.faces) {
    for (int k = 0; k < 3; ++k) directed.insert(edgeKey(f[k], f[(k + 1) % 3]));
  }

  // Hole edge b→a for every boundary half-edge a→b
  std::map<int, std::vector<int>> next;
  for (const auto& f : mesh.faces) {
    for (int k = 0; k < 3; ++k) {
      const int a = f[k];
      const int b = f[(k + 1) % 3];
      if (!directed.count(edgeKey(b, a))) next[b].push_back(a);
    }
  }

  std::vector<std::vector<int>> loops;
  std::unordered_set<int> visited;
  for (const auto& [start, outgoing] : next) {
    if (visited.count(start)) continue;

    std::vector<int> loop;
    bool closed = false;
    int v = start;
    while (true) {
      auto it = next.find(v);
      if (it == next.end() || it->second.size() != 1 || visited.count(v)) {
        break;
      }
      visited.insert(v);
      loop.push_back(v);
      v = it->second.front();
      if (v == start) {
        closed = true;
        break;
      }
    }

    if (closed && loop.size() >= 3) {
      loops.push_back(std::move(loop));
    } else {
      spdlog::debug("[HoleFilling] Skipping open or non-manifold boundary at "
                    "vertex {}",
                    start);
    }
  }
  return loops;
}

size_t fillHoles(TriangleMesh& mesh, int max_hole_size,
                 bool self_intersection_guard) {
  if (mesh.isPointCloud()) return 0;

  const auto loops = findBoundaryLoops(mesh);
  const bool face_colors = mesh.hasFaceColors();
  size_t filled = 0;

  for (const auto& loop : loops) {
    if (static_cast<int>(loop.size()) > max_hole_size) continue;

    std::vector<Face> patch;
    if (!triangulateLoop(mesh, loop, self_intersection_guard, patch)) {
      spdlog::debug("[HoleFilling] No valid ear for hole of {} edges, left open",
                    loop.size());
      continue;
    }

    for (const auto& f : patch) {
      mesh.faces.push_back(f);
      if (face_colors) mesh.face_colors.push_back(Color{});
    }
    ++filled;
  }

  spdlog::debug("[HoleFilling] {} of {} boundary loops closed", filled,
                loops.size());
  return filled;
}

}  // namespace processing
}  // namespace meshtools
