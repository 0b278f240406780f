// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * tool_server.hpp
 *
 * Model Context Protocol tool server: JSON-RPC 2.0 messages, one per line,
 * over a pair of streams (stdin / stdout for the stdio transport).
 *
 * Methods: initialize, notifications/initialized, ping, tools/list,
 * tools/call. A tool that throws produces a normal result flagged with
 * isError; protocol violations produce JSON-RPC errors.
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#ifndef MESHTOOLS_SERVER_TOOL_SERVER_HPP
#define MESHTOOLS_SERVER_TOOL_SERVER_HPP

#include <functional>
#include <iosfwd>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace meshtools {
namespace server {

using json = nlohmann::json;

/// JSON-RPC 2.0 error codes.
namespace rpc_error {
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;
}  // namespace rpc_error

constexpr auto kProtocolVersion = "2024-11-05";

struct Tool {
  std::string name;
  std::string description;
  json input_schema;  ///< JSON Schema of the arguments object
  /// Returns the result object; throw to report a tool failure
  std::function<json(const json& arguments)> handler;
};

class ToolServer {
 public:
  ToolServer(std::string name, std::string version);

  /// @throws std::invalid_argument on a duplicate name or missing handler
  void registerTool(Tool tool);

  bool hasTool(const std::string& name) const { return tools_.count(name) > 0; }
  size_t toolCount() const { return tools_.size(); }

  /// True once the client sent notifications/initialized
  bool initialized() const { return initialized_; }

  /**
   * @brief Handles one decoded message (request, notification or batch).
   * @return Response, or nullopt when nothing must be sent back
   */
  std::optional<json> handle(const json& message);

  /// Parses and handles one line; returns the serialized response if any.
  std::optional<std::string> handleMessage(const std::string& line);

  /// Serve until `in` reaches end of file.
  void run(std::istream& in, std::ostream& out);

 private:
  std::optional<json> handleSingle(const json& request);

  json initialize(const json& params);
  json listTools() const;
  json callTool(const json& params);

  std::string name_;
  std::string version_;
  std::map<std::string, Tool> tools_;  ///< Listed in name order
  bool initialized_ = false;
};

}  // namespace server
}  // namespace meshtools

#endif  // MESHTOOLS_SERVER_TOOL_SERVER_HPP
