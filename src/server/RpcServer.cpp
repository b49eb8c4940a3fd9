#include "autocode/server/RpcServer.hpp"
#include "autocode/Logger.hpp"
#include "autocode/errors.hpp"

#include <string>

using json = nlohmann::json;

namespace autocode {
namespace server {

namespace {

bool is_blank(const std::string &line) {
  return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

std::string id_label(const json &id) {
  return id.is_null() ? std::string("-") : id.dump();
}

} // namespace

json make_result(const json &id, const json &result) {
  return {{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
}

json make_error(const json &id, int code, const std::string &message,
                const json &data) {
  json err = {{"code", code}, {"message", message}};
  if (!data.is_null())
    err["data"] = data;
  return {{"jsonrpc", "2.0"}, {"id", id}, {"error", err}};
}

RpcServer::RpcServer(const ToolRegistry &registry, OutputChannel &output,
                     AuditLog &audit, ServerInfo info)
    : registry_(registry), output_(output), audit_(audit),
      info_(std::move(info)),
      sessions_(
          [this](const json &call_id, const std::string &event,
                 const json &data) { send_notification(call_id, event, data); },
          &audit) {}

void RpcServer::send_notification(const json &call_id,
                                  const std::string &event, const json &data) {
  output_.write_json(
      {{"jsonrpc", "2.0"},
       {"method", "tools/stream"},
       {"params", {{"callId", call_id}, {"event", event}, {"data", data}}}});
}

void RpcServer::serve(std::istream &in) {
  LOG_INFO("RPC", "SERVE", "Serving {} tools on stdio", registry_.size());
  audit_.record("server_start", {{"tools", registry_.names()}});

  std::string line;
  while (!shutdown_requested_ && !stop_requested_ && std::getline(in, line)) {
    if (stop_requested_)
      break;
    process_line(line);
  }

  if (stop_requested_) {
    LOG_INFO("RPC", "SERVE", "Stop requested");
    audit_.record("server_shutdown", {{"reason", "stop"}});
  } else if (shutdown_requested_) {
    LOG_INFO("RPC", "SERVE", "Shutdown requested");
    audit_.record("server_shutdown", json::object());
  } else {
    LOG_INFO("RPC", "SERVE", "End of input");
    audit_.record("server_shutdown", {{"reason", "eof"}});
  }
}

std::optional<json> RpcServer::process_line(const std::string &line) {
  auto response = handle_line(line);
  if (response)
    output_.write_json(*response);
  sessions_.launch_pending();
  return response;
}

std::optional<json> RpcServer::handle_line(const std::string &line) {
  if (is_blank(line))
    return std::nullopt;

  json request;
  try {
    request = json::parse(line);
  } catch (const json::parse_error &ex) {
    LOG_WARN("RPC", "PARSE", "Unparseable request: {}", ex.what());
    audit_.record("parse_error", {{"line", line}});
    return make_error(nullptr, PARSE_ERROR, "Parse error");
  }

  if (request.is_array()) {
    json responses = handle_batch(request);
    if (responses.empty() && !request.empty())
      return std::nullopt;
    return responses;
  }
  return handle_request(request);
}

json RpcServer::handle_batch(const json &batch) {
  audit_.record("batch", {{"size", batch.size()}});
  if (batch.empty())
    return make_error(nullptr, INVALID_REQUEST, "Invalid Request");

  json responses = json::array();
  for (const auto &element : batch) {
    auto response = handle_request(element);
    if (response)
      responses.push_back(std::move(*response));
  }
  return responses;
}

std::optional<json> RpcServer::handle_request(const json &request) {
  if (!request.is_object()) {
    audit_.record("error", {{"error", "Invalid Request"}, {"raw", request}});
    return make_error(nullptr, INVALID_REQUEST, "Invalid Request");
  }

  bool notification = !request.contains("id");
  json id = request.value("id", json(nullptr));
  auto method_it = request.find("method");
  if (method_it == request.end() || !method_it->is_string()) {
    audit_.record("error", {{"id", id}, {"error", "Invalid Request"}});
    if (notification)
      return std::nullopt;
    return make_error(id, INVALID_REQUEST, "Invalid Request");
  }
  std::string method = method_it->get<std::string>();
  json params = request.value("params", json::object());
  if (params.is_null())
    params = json::object();

  audit_.record("request", {{"id", id}, {"method", method}, {"raw", request}});
  LOG_DEBUG("RPC", id_label(id), "Request {}", method);

  json response;
  try {
    response = dispatch(id, method, params);
  } catch (const std::exception &ex) {
    LOG_ERROR("RPC", id_label(id), "Exception in {}: {}", method, ex.what());
    audit_.record("error",
                  {{"id", id}, {"method", method}, {"error", ex.what()}});
    response = make_error(id, SERVER_ERROR,
                          std::string("Exception: ") + ex.what());
  }

  if (notification)
    return std::nullopt;
  return response;
}

json RpcServer::dispatch(const json &id, const std::string &method,
                         const json &params) {
  if (method == "initialize") {
    return make_result(
        id, {{"protocolVersion", PROTOCOL_VERSION},
             {"serverInfo", {{"name", info_.name}, {"version", info_.version}}},
             {"capabilities", {{"tools", {{"listChanged", false}}}}}});
  }
  if (method == "shutdown") {
    shutdown_requested_ = true;
    return make_result(id, json::object());
  }
  if (method == "ping")
    return make_result(id, {{"pong", true}});
  if (method == "tools/list")
    return make_result(id, {{"tools", registry_.list()}});
  if (method == "tools/call")
    return handle_tools_call(id, params);
  if (method == "tools/cancel")
    return handle_tools_cancel(id, params);

  return make_error(id, METHOD_NOT_FOUND,
                    "Unknown method '" + method + "'");
}

json RpcServer::handle_tools_call(const json &id, const json &params) {
  std::string name = params.value("name", "");
  json arguments = params.value("arguments", json::object());
  if (arguments.is_null())
    arguments = json::object();
  bool stream = params.value("stream", false);

  const Tool *tool = registry_.find(name);
  if (!tool)
    return make_error(id, METHOD_NOT_FOUND, "Unknown tool '" + name + "'");

  if (!arguments.is_object())
    return make_error(id, INVALID_PARAMS, "Arguments must be an object");

  for (const auto &required : tool->required_arguments()) {
    if (!arguments.contains(required)) {
      return make_error(id, INVALID_PARAMS,
                        "Missing required argument '" + required + "'");
    }
  }

  if (stream) {
    if (!tool->streaming()) {
      return make_error(id, INVALID_PARAMS,
                        "Tool '" + name + "' does not support streaming");
    }
    if (!sessions_.start(id, *tool, arguments)) {
      return make_error(id, INVALID_PARAMS,
                        "Stream already active for call id " + id.dump());
    }
    return make_result(id, {{"streaming", true}, {"callId", id}});
  }

  if (!tool->handler) {
    return make_error(id, INVALID_PARAMS,
                      "Tool '" + name + "' is only available as a stream");
  }

  json payload;
  bool is_error = false;
  try {
    payload = tool->handler(arguments);
  } catch (const ToolError &ex) {
    LOG_WARN("RPC", id_label(id), "Tool {} failed: {}: {}", name, ex.kind(),
             ex.what());
    payload = structured_error(ex);
    is_error = true;
  } catch (const std::exception &ex) {
    LOG_ERROR("RPC", id_label(id), "Tool {} threw: {}", name, ex.what());
    audit_.record("error", {{"id", id}, {"tool", name}, {"error", ex.what()}});
    return make_error(id, SERVER_ERROR,
                      "Tool '" + name + "' failed: " + ex.what());
  }

  json summary_keys = nullptr;
  if (payload.is_object()) {
    summary_keys = json::array();
    for (auto it = payload.begin(); it != payload.end(); ++it)
      summary_keys.push_back(it.key());
  }
  audit_.record("tool_call", {{"id", id},
                              {"tool", name},
                              {"arguments", arguments},
                              {"result_summary_keys", summary_keys}});

  json result = {{"content", json::array({{{"type", "json"}, {"json", payload}}})}};
  if (is_error)
    result["isError"] = true;
  return make_result(id, result);
}

json RpcServer::handle_tools_cancel(const json &id, const json &params) {
  if (!params.contains("callId"))
    return make_error(id, INVALID_PARAMS, "Missing required argument 'callId'");

  const json &call_id = params["callId"];
  if (sessions_.cancel(call_id))
    return make_result(id, {{"cancelled", true}, {"callId", call_id}});
  return make_result(
      id, {{"cancelled", false}, {"reason", "not_found"}, {"callId", call_id}});
}

} // namespace server
} // namespace autocode
