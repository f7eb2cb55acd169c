#pragma once

#include <cstdint>
#include <string>

namespace cascade {

// Per-graph settings. Defaults need no configuration file; see
// cascade/config/config_loader.hpp for loading them from cascade.toml.
struct GraphConfig {
  // Record propagation events in the graph's TraceManager.
  bool trace = false;

  // spdlog level name applied by config::ApplyLogLevel.
  std::string log_level = "warn";

  // Upper bound on rank-ordered sweeps in one flush. Only a compute step
  // that writes to its own upstream variables can exhaust it.
  uint32_t max_flush_passes = 1024;
};

}  // namespace cascade
