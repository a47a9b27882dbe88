#include "sinks/stdout_debug.hpp"

#include <cstdio>

namespace boiler_twin::sinks {

void StdoutDebugSink::publish(const std::string& session_id, const core::StepResult& result) const {
  const auto& state = result.state;
  const auto& decision = result.decision;
  std::printf("[step] session=%s tick=%llu fire=%.1f->%.1f%s level=%.2f pressure=%.2f temp=%.2f "
              "predicted_final=%.2f status=%s\n",
              session_id.c_str(), static_cast<unsigned long long>(state.tick), decision.requested_input,
              decision.effective_input, decision.intervened ? " (override)" : "", state.water_level, state.pressure,
              state.temperature, decision.forecast.final_value, model::to_string(state.status));
  for (const auto& alarm : state.alarms) {
    std::printf("[alarm] session=%s %s\n", session_id.c_str(), alarm.c_str());
  }
}

}  // namespace boiler_twin::sinks
