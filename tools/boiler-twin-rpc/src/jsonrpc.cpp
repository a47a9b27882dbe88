#include "rpc/jsonrpc.hpp"

#include <utility>

namespace boiler_twin::rpc {

namespace {

bool is_valid_id(const nlohmann::json& id) {
  return id.is_null() || id.is_string() || id.is_number_integer() || id.is_number_unsigned();
}

}  // namespace

JsonRpcRequest parse_request(const nlohmann::json& request) {
  if (request.is_array()) {
    throw InvalidRequest("batch requests are not supported", nullptr);
  }
  if (!request.is_object()) {
    throw InvalidRequest("request must be a JSON object", nullptr);
  }

  // Read the id first so later envelope errors can echo it back.
  JsonRpcRequest parsed{};
  nlohmann::json reply_id = nullptr;
  if (const auto id_it = request.find("id"); id_it != request.end()) {
    if (!is_valid_id(*id_it)) {
      throw InvalidRequest("id must be a string, an integer or null", nullptr);
    }
    reply_id = *id_it;
    parsed.id = *id_it;
  }

  const auto version_it = request.find("jsonrpc");
  if (version_it == request.end() || !version_it->is_string() ||
      version_it->get_ref<const std::string&>() != kJsonRpcVersion) {
    throw InvalidRequest("jsonrpc must be \"2.0\"", reply_id);
  }

  const auto method_it = request.find("method");
  if (method_it == request.end() || !method_it->is_string() || method_it->get_ref<const std::string&>().empty()) {
    throw InvalidRequest("method must be a non-empty string", reply_id);
  }
  parsed.method = method_it->get<std::string>();

  // Methods take named params only; a missing member means no arguments.
  parsed.params = nlohmann::json::object();
  if (const auto params_it = request.find("params"); params_it != request.end() && !params_it->is_null()) {
    if (!params_it->is_object()) {
      throw InvalidRequest("params must be an object", reply_id);
    }
    parsed.params = *params_it;
  }

  return parsed;
}

nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result) {
  nlohmann::json response = nlohmann::json::object();
  response["jsonrpc"] = kJsonRpcVersion;
  response["id"] = id;
  response["result"] = result;
  return response;
}

nlohmann::json make_error_response(const nlohmann::json& id, const int code, const std::string& message) {
  nlohmann::json response = nlohmann::json::object();
  response["jsonrpc"] = kJsonRpcVersion;
  response["id"] = id;
  response["error"] = {{"code", code}, {"message", message}};
  return response;
}

}  // namespace boiler_twin::rpc
