#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

namespace boiler_twin::rpc {

inline constexpr const char* kJsonRpcVersion = "2.0";

inline constexpr int kParseError = -32700;
inline constexpr int kInvalidRequest = -32600;
inline constexpr int kMethodNotFound = -32601;
inline constexpr int kInvalidParams = -32602;
inline constexpr int kInternalError = -32603;
inline constexpr int kDependencyUnavailable = -32001;

// The envelope around a call is malformed. Carries whatever id could be read
// so the error response can still be correlated.
class InvalidRequest : public std::runtime_error {
 public:
  InvalidRequest(const std::string& what, nlohmann::json id) : std::runtime_error(what), id_(std::move(id)) {}

  [[nodiscard]] const nlohmann::json& id() const noexcept { return id_; }

 private:
  nlohmann::json id_;
};

struct JsonRpcRequest {
  std::string method;
  nlohmann::json params;
  // Absent for notifications.
  std::optional<nlohmann::json> id;

  [[nodiscard]] bool is_notification() const noexcept { return !id.has_value(); }
};

// Throws InvalidRequest for envelope errors. Params contents are left to the
// method handlers.
JsonRpcRequest parse_request(const nlohmann::json& request);

nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result);
nlohmann::json make_error_response(const nlohmann::json& id, int code, const std::string& message);

}  // namespace boiler_twin::rpc
