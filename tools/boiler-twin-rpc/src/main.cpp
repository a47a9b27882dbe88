#include <exception>
#include <iostream>
#include <memory>
#include <string>

#include "core/bootstrap.hpp"
#include "core/config.hpp"
#include "core/session_registry.hpp"
#include "rpc/methods.hpp"
#include "rpc/server.hpp"

int main(int argc, char** argv) {
  const std::string config_path = argc > 1 ? argv[1] : "configs/boiler_twin.yaml";

  boiler_twin::core::SimulatorConfig config{};
  try {
    config = boiler_twin::core::load_simulator_config(config_path);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  auto registry = std::make_shared<boiler_twin::core::SessionRegistry>(
      boiler_twin::core::make_session_options(config), boiler_twin::core::load_forecast_engine(config.forecast));
  registry->get_or_create(boiler_twin::core::kDefaultSessionId);

  std::cerr << "[rpc] serving JSON-RPC on stdin/stdout with config " << config_path << '\n';
  boiler_twin::rpc::Server server(boiler_twin::rpc::build_method_registry(registry));
  return server.run(std::cin, std::cout, std::cerr);
}
