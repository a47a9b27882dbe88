#pragma once

#include <string>

#include "core/session.hpp"

namespace boiler_twin::sinks {

class StdoutDebugSink {
 public:
  void publish(const std::string& session_id, const core::StepResult& result) const;
};

}  // namespace boiler_twin::sinks
