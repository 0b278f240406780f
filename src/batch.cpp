// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * batch.cpp
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "meshtools/batch/batch.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace meshtools {

namespace fs = std::filesystem;

namespace {

std::string lowerExtension(const fs::path& path) {
  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return ext;
}

fs::path canonicalOrSelf(const fs::path& path) {
  std::error_code ec;
  auto canonical = fs::weakly_canonical(path, ec);
  return ec ? fs::absolute(path) : canonical;
}

}  // namespace

const char* toString(BatchStatus status) {
  return status == BatchStatus::Ok ? "ok" : "error";
}

BatchSummary summarize(const std::vector<BatchRecord>& records) {
  BatchSummary summary;
  summary.total = records.size();
  for (const auto& r : records) {
    if (r.status == BatchStatus::Ok) {
      ++summary.ok;
    } else {
      ++summary.failed;
    }
  }
  return summary;
}

const std::set<std::string>& meshExtensions() {
  static const std::set<std::string> extensions = {
      ".ply", ".obj", ".stl", ".off", ".xyz",  ".pts", ".3ds",
      ".dae", ".x3d", ".wrl", ".glb", ".gltf", ".pcd"};
  return extensions;
}

bool isMeshFile(const fs::path& path) {
  std::error_code ec;
  return fs::is_regular_file(path, ec) &&
         meshExtensions().count(lowerExtension(path)) > 0;
}

std::vector<fs::path> findMeshFiles(const fs::path& dir, bool recursive) {
  std::vector<fs::path> files;
  if (recursive) {
    for (const auto& entry : fs::recursive_directory_iterator(dir)) {
      if (isMeshFile(entry.path())) files.push_back(entry.path());
    }
  } else {
    for (const auto& entry : fs::directory_iterator(dir)) {
      if (isMeshFile(entry.path())) files.push_back(entry.path());
    }
  }
  std::sort(files.begin(), files.end());
  return files;
}

std::string normalizeExtension(const std::string& format) {
  if (format.empty() || format == ".") {
    throw std::invalid_argument("Output format must not be empty");
  }
  return format.front() == '.' ? format : "." + format;
}

BatchProcessor::BatchProcessor(MeshEngine::Ptr engine,
                               const config::Batch& options,
                               const SaveOptions& save)
    : engine_(std::move(engine)), options_(options), save_(save) {
  if (!engine_) {
    throw std::invalid_argument("BatchProcessor requires an engine");
  }
  options_.output_format = normalizeExtension(options_.output_format);
}

std::vector<BatchRecord> BatchProcessor::run(
    const std::string& input_dir, const std::string& output_dir,
    const std::function<void(const fs::path&, const fs::path&, BatchRecord&)>&
        per_file,
    const std::optional<fs::path>& skip) const {
  const fs::path input_path(input_dir);
  if (!fs::is_directory(input_path)) {
    throw std::invalid_argument("Input directory does not exist: " +
                                input_dir);
  }
  const fs::path output_path(output_dir);
  fs::create_directories(output_path);

  const auto files = findMeshFiles(input_path, options_.recursive);
  spdlog::info("[Batch] {} mesh files in '{}'", files.size(), input_dir);

  std::vector<BatchRecord> records;
  for (const auto& file : files) {
    if (skip && canonicalOrSelf(file) == *skip) {
      spdlog::debug("[Batch] Skipping target '{}'", file.string());
      continue;
    }

    fs::path out_file = output_path / fs::relative(file, input_path);
    out_file.replace_extension(options_.output_format);

    BatchRecord record;
    record.input = file.string();
    record.output = out_file.string();
    try {
      per_file(file, out_file, record);
      record.status = BatchStatus::Ok;
    } catch (const std::exception& e) {
      record.status = BatchStatus::Error;
      record.error = e.what();
      spdlog::warn("[Batch] '{}' failed: {}", record.input, record.error);
    }
    records.push_back(std::move(record));
  }

  const auto summary = summarize(records);
  spdlog::info("[Batch] Done: {} ok, {} failed", summary.ok, summary.failed);
  return records;
}

std::vector<BatchRecord> BatchProcessor::process(
    const std::string& input_dir, const std::string& output_dir,
    const Operation& operation) const {
  return run(
      input_dir, output_dir,
      [&](const fs::path& file, const fs::path& out_file, BatchRecord& record) {
        MeshSession session(engine_);
        session.loadMesh(file.string());
        operation(session, record);
        session.saveMesh(out_file.string(), std::nullopt, save_);
      },
      std::nullopt);
}

std::vector<BatchRecord> BatchProcessor::repair(
    const std::string& input_dir, const std::string& output_dir,
    const config::Repair& options) const {
  return process(input_dir, output_dir,
                 [&](MeshSession& session, BatchRecord& record) {
                   record.repair = repairMesh(session, std::nullopt, options);
                 });
}

std::vector<BatchRecord> BatchProcessor::align(
    const std::string& input_dir, const std::string& output_dir,
    const std::string& target_mesh, const config::Icp& params) const {
  return run(
      input_dir, output_dir,
      [&](const fs::path& file, const fs::path& out_file, BatchRecord& record) {
        MeshSession session(engine_);
        const int target_id = session.loadMesh(target_mesh);
        const int source_id = session.loadMesh(file.string());
        record.alignment = alignIcp(session, source_id, target_id, params);
        session.saveMesh(out_file.string(), source_id, save_);
      },
      canonicalOrSelf(target_mesh));
}

}  // namespace meshtools
