#include "rpc/server.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "core/errors.hpp"
#include "rpc/jsonrpc.hpp"

namespace boiler_twin::rpc {

Server::Server(MethodRegistry methods) : methods_(std::move(methods)) {}

int Server::run(std::istream& in, std::ostream& out, std::ostream& err) const {
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) {
      continue;
    }

    nlohmann::json request;
    try {
      request = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& ex) {
      err << "[rpc] malformed request: " << ex.what() << '\n';
      out << make_error_response(nullptr, kParseError, "parse error").dump() << '\n';
      out.flush();
      continue;
    }

    bool should_respond = true;
    const auto response = handle_request(request, should_respond);
    if (should_respond) {
      out << response.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
      out.flush();
    }
  }

  return 0;
}

nlohmann::json Server::handle_request(const nlohmann::json& request, bool& should_respond) const {
  JsonRpcRequest parsed{};
  try {
    parsed = parse_request(request);
  } catch (const InvalidRequest& ex) {
    std::cerr << "[rpc] invalid request: " << ex.what() << '\n';
    should_respond = true;
    return make_error_response(ex.id(), kInvalidRequest, ex.what());
  }

  should_respond = !parsed.is_notification();
  const nlohmann::json id = parsed.id.value_or(nullptr);

  try {
    if (parsed.method == "initialize") {
      return make_result_response(id, handle_initialize(parsed.params));
    }
    if (parsed.method == "methods/list") {
      return make_result_response(id, handle_methods_list());
    }

    const auto method_it = methods_.find(parsed.method);
    if (method_it == methods_.end()) {
      return make_error_response(id, kMethodNotFound, "method not found: " + parsed.method);
    }
    return make_result_response(id, method_it->second.handler(parsed.params));
  } catch (const core::DependencyUnavailable& ex) {
    std::cerr << "[rpc] " << parsed.method << ": " << ex.what() << '\n';
    return make_error_response(id, kDependencyUnavailable, ex.what());
  } catch (const std::invalid_argument& ex) {
    return make_error_response(id, kInvalidParams, ex.what());
  } catch (const std::exception& ex) {
    std::cerr << "[rpc] " << parsed.method << " failed: " << ex.what() << '\n';
    return make_error_response(id, kInternalError, "internal error");
  }
}

nlohmann::json Server::handle_initialize(const nlohmann::json& /*params*/) const {
  return nlohmann::json{{"serverInfo", {{"name", "boiler-twin-rpc"}, {"version", "0.1.0"}}},
                        {"capabilities", {{"methods", handle_methods_list()["methods"]}}}};
}

nlohmann::json Server::handle_methods_list() const {
  std::vector<const Method*> sorted;
  sorted.reserve(methods_.size());
  for (const auto& [_, method] : methods_) {
    sorted.push_back(&method);
  }
  std::sort(sorted.begin(), sorted.end(), [](const Method* a, const Method* b) { return a->name < b->name; });

  nlohmann::json methods = nlohmann::json::array();
  for (const Method* method : sorted) {
    methods.push_back({{"name", method->name}, {"description", method->description}});
  }
  return nlohmann::json{{"methods", methods}};
}

}  // namespace boiler_twin::rpc
