// SPDX-License-Identifier: BSD-3-Clause
// Copyright (c) 2024 Ikhyeon Cho <tre0430@korea.ac.kr>

/*
 * tool_server.cpp
 *
 *  Created on: Mar 2025
 *      Author: Ikhyeon Cho
 *   Institute: Korea Univ. ISR (Intelligent Systems & Robotics) Lab
 *       Email: tre0430@korea.ac.kr
 */

#include "meshtools/server/tool_server.hpp"

#include <spdlog/spdlog.h>

#include <istream>
#include <ostream>
#include <stdexcept>

namespace meshtools {
namespace server {

namespace {

/// Protocol-level failure, turned into a JSON-RPC error object.
class RpcError : public std::runtime_error {
 public:
  RpcError(int code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  int code() const noexcept { return code_; }

 private:
  int code_;
};

json errorResponse(const json& id, int code, const std::string& message) {
  return {{"jsonrpc", "2.0"},
          {"id", id},
          {"error", {{"code", code}, {"message", message}}}};
}

std::string serialize(const json& j, int indent = -1) {
  return j.dump(indent, ' ', false, json::error_handler_t::replace);
}

json textContent(const std::string& text, bool is_error) {
  return {{"content", json::array({{{"type", "text"}, {"text", text}}})},
          {"isError", is_error}};
}

bool isSupportedVersion(const std::string& version) {
  return version == "2024-11-05" || version == "2025-03-26" ||
         version == "2025-06-18";
}

}  // namespace

ToolServer::ToolServer(std::string name, std::string version)
    : name_(std::move(name)), version_(std::move(version)) {}

void ToolServer::registerTool(Tool tool) {
  if (!tool.handler) {
    throw std::invalid_argument("Tool '" + tool.name + "' has no handler");
  }
  if (tools_.count(tool.name)) {
    throw std::invalid_argument("Tool '" + tool.name + "' already registered");
  }
  const std::string name = tool.name;
  tools_.emplace(name, std::move(tool));
}

// ─── Dispatch ───────────────────────────────────────────────────────────────

std::optional<json> ToolServer::handle(const json& message) {
  if (!message.is_array()) return handleSingle(message);

  if (message.empty()) {
    return errorResponse(nullptr, rpc_error::kInvalidRequest, "Empty batch");
  }
  json responses = json::array();
  for (const auto& request : message) {
    if (auto response = handleSingle(request)) {
      responses.push_back(std::move(*response));
    }
  }
  if (responses.empty()) return std::nullopt;
  return responses;
}

std::optional<json> ToolServer::handleSingle(const json& request) {
  if (!request.is_object()) {
    return errorResponse(nullptr, rpc_error::kInvalidRequest,
                         "Request must be an object");
  }

  const bool is_notification = !request.contains("id");
  const json id = is_notification ? json(nullptr) : request["id"];
  if (!id.is_null() && !id.is_string() && !id.is_number_integer()) {
    return errorResponse(nullptr, rpc_error::kInvalidRequest,
                         "id must be a string or an integer");
  }

  try {
    if (!request.contains("jsonrpc") || request["jsonrpc"] != "2.0") {
      throw RpcError(rpc_error::kInvalidRequest, "jsonrpc must be \"2.0\"");
    }
    if (!request.contains("method") || !request["method"].is_string()) {
      throw RpcError(rpc_error::kInvalidRequest, "method must be a string");
    }
    const auto method = request["method"].get<std::string>();
    const json params = request.value("params", json::object());
    if (!params.is_object() && !params.is_array()) {
      throw RpcError(rpc_error::kInvalidRequest,
                     "params must be an object or an array");
    }

    json result = json::object();
    if (method == "initialize") {
      result = initialize(params);
    } else if (method == "notifications/initialized") {
      initialized_ = true;
      spdlog::debug("[ToolServer] Client initialized");
    } else if (method == "ping") {
      result = json::object();
    } else if (method == "tools/list") {
      result = listTools();
    } else if (method == "tools/call") {
      result = callTool(params);
    } else if (method.rfind("notifications/", 0) == 0) {
      spdlog::debug("[ToolServer] Ignoring notification '{}'", method);
    } else {
      throw RpcError(rpc_error::kMethodNotFound,
                     "Method not found: " + method);
    }

    if (is_notification) return std::nullopt;
    return json{{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
  } catch (const RpcError& e) {
    spdlog::warn("[ToolServer] {} ({})", e.what(), e.code());
    if (is_notification) return std::nullopt;
    return errorResponse(id, e.code(), e.what());
  } catch (const std::exception& e) {
    spdlog::error("[ToolServer] Internal error: {}", e.what());
    if (is_notification) return std::nullopt;
    return errorResponse(id, rpc_error::kInternalError, e.what());
  }
}

std::optional<std::string> ToolServer::handleMessage(const std::string& line) {
  json message;
  try {
    message = json::parse(line);
  } catch (const json::parse_error& e) {
    spdlog::warn("[ToolServer] Parse error: {}", e.what());
    return serialize(
        errorResponse(nullptr, rpc_error::kParseError, "Parse error"));
  }

  auto response = handle(message);
  if (!response) return std::nullopt;
  return serialize(*response);
}

void ToolServer::run(std::istream& in, std::ostream& out) {
  spdlog::info("[ToolServer] {} {} serving {} tools on stdio", name_, version_,
               tools_.size());

  std::string line;
  while (std::getline(in, line)) {
    if (line.find_first_not_of(" \t\r\n") == std::string::npos) continue;
    if (auto response = handleMessage(line)) {
      out << *response << '\n';
      out.flush();
    }
  }
  spdlog::info("[ToolServer] Input closed, shutting down");
}

// ─── Methods ────────────────────────────────────────────────────────────────

json ToolServer::initialize(const json& params) {
  std::string version = kProtocolVersion;
  if (params.is_object() && params.contains("protocolVersion") &&
      params["protocolVersion"].is_string()) {
    const auto requested = params["protocolVersion"].get<std::string>();
    if (isSupportedVersion(requested)) version = requested;
  }

  spdlog::info("[ToolServer] initialize (protocol {})", version);
  return {{"protocolVersion", version},
          {"capabilities", {{"tools", {{"listChanged", false}}}}},
          {"serverInfo", {{"name", name_}, {"version", version_}}}};
}

json ToolServer::listTools() const {
  json tools = json::array();
  for (const auto& [name, tool] : tools_) {
    tools.push_back({{"name", tool.name},
                     {"description", tool.description},
                     {"inputSchema", tool.input_schema}});
  }
  return {{"tools", tools}};
}

json ToolServer::callTool(const json& params) {
  if (!params.is_object() || !params.contains("name") ||
      !params["name"].is_string()) {
    throw RpcError(rpc_error::kInvalidParams, "tools/call requires a name");
  }
  const auto name = params["name"].get<std::string>();
  const json arguments = params.value("arguments", json::object());
  if (!arguments.is_object()) {
    throw RpcError(rpc_error::kInvalidParams, "arguments must be an object");
  }

  auto it = tools_.find(name);
  if (it == tools_.end()) {
    throw RpcError(rpc_error::kInvalidParams, "Unknown tool: " + name);
  }

  spdlog::info("[ToolServer] Calling tool '{}'", name);
  try {
    return textContent(serialize(it->second.handler(arguments), 2), false);
  } catch (const std::exception& e) {
    spdlog::warn("[ToolServer] Tool '{}' failed: {}", name, e.what());
    return textContent(serialize(json{{"error", e.what()}}, 2), true);
  }
}

}  // namespace server
}  // namespace meshtools
