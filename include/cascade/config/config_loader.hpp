#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "cascade/common/error.hpp"
#include "cascade/config/graph_config.hpp"

namespace cascade::config {

// Malformed or invalid cascade.toml.
class ConfigError : public Error {
 public:
  explicit ConfigError(const std::string& message) : Error(message) {
  }
};

// Search for cascade.toml starting from dir, going up to parent dirs
// Returns nullopt if not found
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse cascade.toml. Every key is optional; missing keys keep the
// GraphConfig defaults.
//
//   [graph]
//   trace = true
//   log_level = "debug"
//   max_flush_passes = 64
//
// Throws ConfigError on parse errors, wrong value types, unknown log levels
// or a zero pass limit.
auto LoadConfig(const std::filesystem::path& config_path) -> GraphConfig;

// Sets spdlog's global level from config.log_level.
void ApplyLogLevel(const GraphConfig& config);

}  // namespace cascade::config
