#include "cascade/config/config_loader.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <filesystem>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <toml++/toml.hpp>

#include "cascade/config/graph_config.hpp"

namespace cascade::config {

namespace fs = std::filesystem;

namespace {

constexpr std::array<std::string_view, 7> kLogLevels = {
    "trace", "debug", "info", "warn", "error", "critical", "off"};

[[noreturn]] void Fail(const fs::path& path, const std::string& detail) {
  throw ConfigError(fmt::format("{}: {}", path.string(), detail));
}

}  // namespace

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path config_path = dir / "cascade.toml";
    if (fs::exists(config_path)) {
      return config_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      // Reached root
      return std::nullopt;
    }
    dir = parent;
  }
}

auto LoadConfig(const fs::path& config_path) -> GraphConfig {
  GraphConfig config;

  toml::table tbl;
  try {
    tbl = toml::parse_file(config_path.string());
  } catch (const toml::parse_error& e) {
    Fail(config_path, fmt::format("failed to parse: {}", e.what()));
  }

  // [graph] section (optional)
  auto graph = tbl["graph"];
  if (!graph) {
    return config;
  }
  if (!graph.is_table()) {
    Fail(config_path, "'graph' must be a table");
  }

  if (auto node = graph["trace"]) {
    auto trace = node.value<bool>();
    if (!trace) {
      Fail(config_path, "'graph.trace' must be a boolean");
    }
    config.trace = *trace;
  }

  if (auto node = graph["log_level"]) {
    auto level = node.value<std::string>();
    if (!level) {
      Fail(config_path, "'graph.log_level' must be a string");
    }
    if (std::ranges::find(kLogLevels, *level) == kLogLevels.end()) {
      Fail(config_path, fmt::format("unknown log level '{}'", *level));
    }
    config.log_level = *level;
  }

  if (auto node = graph["max_flush_passes"]) {
    auto passes = node.value<int64_t>();
    if (!passes) {
      Fail(config_path, "'graph.max_flush_passes' must be an integer");
    }
    if (*passes <= 0 || *passes > std::numeric_limits<uint32_t>::max()) {
      Fail(
          config_path,
          fmt::format("'graph.max_flush_passes' out of range: {}", *passes));
    }
    config.max_flush_passes = static_cast<uint32_t>(*passes);
  }

  return config;
}

void ApplyLogLevel(const GraphConfig& config) {
  spdlog::set_level(spdlog::level::from_str(config.log_level));
}

}  // namespace cascade::config
