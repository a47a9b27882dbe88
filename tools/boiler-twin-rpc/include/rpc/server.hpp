#pragma once

#include <iosfwd>

#include "rpc/methods.hpp"

namespace boiler_twin::rpc {

// Line-delimited JSON-RPC 2.0: one request per input line, one response per
// request that carries an id.
class Server {
 public:
  explicit Server(MethodRegistry methods);

  int run(std::istream& in, std::ostream& out, std::ostream& err) const;

  nlohmann::json handle_request(const nlohmann::json& request, bool& should_respond) const;

 private:
  nlohmann::json handle_initialize(const nlohmann::json& params) const;
  nlohmann::json handle_methods_list() const;

  MethodRegistry methods_;
};

}  // namespace boiler_twin::rpc
