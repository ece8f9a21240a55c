#include "mcp_protocol.h"

#include <utility>

namespace wxmcp::mcp {

using json = nlohmann::json;

namespace {

std::string dump_line(const json& response) {
  // replace: a stray invalid UTF-8 byte must not cost the client its response.
  return response.dump(-1, ' ', false, json::error_handler_t::replace);
}

json envelope(const std::optional<json>& id) {
  json response;
  response["jsonrpc"] = "2.0";
  response["id"] = id.has_value() ? id.value() : json(nullptr);
  return response;
}

}  // namespace

ParseResult parse_request(const std::string& json_str) {
  json j;
  try {
    j = json::parse(json_str);
  } catch (const json::parse_error& e) {
    return ParseResult::err(ParseError{std::string("Invalid JSON: ") + e.what()});
  }

  if (!j.is_object()) {
    return ParseResult::err(ParseError{"Invalid request: expected a JSON object, got " +
                                       std::string(j.type_name())});
  }

  JsonRpcRequest request;

  const auto id = j.find("id");
  if (id != j.end() && !id->is_null()) {
    request.id = *id;
  }

  const auto method = j.find("method");
  if (method != j.end() && method->is_string()) {
    request.method = method->get<std::string>();
  }

  const auto params = j.find("params");
  request.params = (params != j.end() && params->is_object()) ? *params : json::object();

  return ParseResult::ok(std::move(request));
}

std::string make_response(const std::optional<json>& id, const json& result) {
  json response = envelope(id);
  response["result"] = result;
  return dump_line(response);
}

std::string make_error_response(const std::optional<json>& id, const JsonRpcError& error) {
  json response = envelope(id);
  response["error"] = {
      {"code", error.code},
      {"message", error.message},
  };
  return dump_line(response);
}

ToolCallParams parse_tool_call_params(const json& params) {
  ToolCallParams call;

  const auto name = params.find("name");
  if (name != params.end() && name->is_string()) {
    call.name = name->get<std::string>();
  }

  const auto arguments = params.find("arguments");
  call.arguments =
      (arguments != params.end() && arguments->is_object()) ? *arguments : json::object();

  return call;
}

}  // namespace wxmcp::mcp
