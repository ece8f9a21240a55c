#include "config.h"

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace wxmcp::mcp {

namespace {

using OptionError = std::optional<std::string>;

// ────────────────────────────────────────────────────────────────
// Option Handlers
// ────────────────────────────────────────────────────────────────

OptionError parse_seconds(const std::string& flag, const std::string& value, int& target) {
  try {
    std::size_t consumed = 0;
    const int seconds = std::stoi(value, &consumed);
    if (consumed == value.size()) {
      target = seconds;
      return std::nullopt;
    }
  } catch (const std::logic_error&) {
    // invalid_argument and out_of_range both land here
  }
  return "Invalid " + flag + ": " + value + " (expected whole seconds)";
}

OptionError handle_backend(BridgeConfig& config, const std::string& value) {
  config.backend_url = value;
  return std::nullopt;
}

OptionError handle_timeout(BridgeConfig& config, const std::string& value) {
  return parse_seconds("--timeout", value, config.timeout_seconds);
}

OptionError handle_probe_timeout(BridgeConfig& config, const std::string& value) {
  return parse_seconds("--probe-timeout", value, config.probe_timeout_seconds);
}

OptionError handle_no_probe(BridgeConfig& config, const std::string& /*value*/) {
  config.probe = false;
  return std::nullopt;
}

// ────────────────────────────────────────────────────────────────
// Option Registry
// ────────────────────────────────────────────────────────────────

std::vector<apps::Option<BridgeConfig>> build_option_registry() {
  return {
      {"--backend", true, "Weather backend base URL (default: http://localhost:3000)",
       handle_backend},
      {"--timeout", true, "Seconds allowed per phase of a tool call (default: 10)",
       handle_timeout},
      {"--probe-timeout", true, "Seconds allowed for the startup probe (default: 2)",
       handle_probe_timeout},
      {"--no-probe", false, "Skip the startup connectivity probe", handle_no_probe},
  };
}

}  // namespace

apps::ParsedOptions<BridgeConfig> parse_args(int argc,
                                             char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  return apps::parse_options<BridgeConfig>(argc, argv, build_option_registry());
}

std::string bridge_usage(const std::string& program) {
  return apps::format_usage<BridgeConfig>(program, build_option_registry());
}

}  // namespace wxmcp::mcp
