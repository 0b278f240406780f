// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * batch.hpp
 *
 * Directory-level processing: one fresh session per input file, results
 * mirrored into an output directory, per-file failures recorded instead of
 * aborting the run.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef MESHTOOLS_BATCH_BATCH_HPP
#define MESHTOOLS_BATCH_BATCH_HPP

#include <filesystem>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "meshtools/alignment/alignment.hpp"
#include "meshtools/config/batch.hpp"
#include "meshtools/repair/repair.hpp"

namespace meshtools {

enum class BatchStatus { Ok, Error };

/// "ok" / "error"
const char* toString(BatchStatus status);

/// Outcome for one input file.
struct BatchRecord {
  std::string input;
  std::string output;
  BatchStatus status = BatchStatus::Ok;
  std::string error;  ///< Set when status == Error
  std::optional<RepairReport> repair;
  std::optional<IcpResult> alignment;
};

struct BatchSummary {
  size_t total = 0;
  size_t ok = 0;
  size_t failed = 0;
};

BatchSummary summarize(const std::vector<BatchRecord>& records);

/// Lower-case extensions (with dot) picked up from input directories.
const std::set<std::string>& meshExtensions();

/// Regular file with a whitelisted extension (case-insensitive).
bool isMeshFile(const std::filesystem::path& path);

/// Mesh files in dir (sorted; sub-directories when recursive).
std::vector<std::filesystem::path> findMeshFiles(
    const std::filesystem::path& dir, bool recursive);

/// "ply" → ".ply"; @throws std::invalid_argument when empty
std::string normalizeExtension(const std::string& format);

class BatchProcessor {
 public:
  /// Runs on a session holding the loaded input mesh (current).
  using Operation = std::function<void(MeshSession&, BatchRecord&)>;

  /// @throws std::invalid_argument null engine or empty output format
  BatchProcessor(MeshEngine::Ptr engine, const config::Batch& options = {},
                 const SaveOptions& save = {});

  /**
   * @brief Load, run `operation`, save, for every mesh file in input_dir.
   *
   * Output files keep the input's relative path with the extension replaced
   * by the configured output format.
   *
   * @throws std::invalid_argument input_dir is not a directory
   */
  std::vector<BatchRecord> process(const std::string& input_dir,
                                   const std::string& output_dir,
                                   const Operation& operation) const;

  /// repairMesh() on every file.
  std::vector<BatchRecord> repair(const std::string& input_dir,
                                  const std::string& output_dir,
                                  const config::Repair& options = {}) const;

  /**
   * @brief ICP-align every file onto target_mesh; only sources are written.
   *
   * The target is loaded first (id 0) in each session. If the target itself
   * lives in input_dir it is skipped.
   */
  std::vector<BatchRecord> align(const std::string& input_dir,
                                 const std::string& output_dir,
                                 const std::string& target_mesh,
                                 const config::Icp& params = {}) const;

 private:
  std::vector<BatchRecord> run(
      const std::string& input_dir, const std::string& output_dir,
      const std::function<void(const std::filesystem::path&,
                               const std::filesystem::path&, BatchRecord&)>&
          per_file,
      const std::optional<std::filesystem::path>& skip) const;

  MeshEngine::Ptr engine_;
  config::Batch options_;
  SaveOptions save_;
};

}  // namespace meshtools

#endif  // MESHTOOLS_BATCH_BATCH_HPP
