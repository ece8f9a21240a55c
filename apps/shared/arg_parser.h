#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace wxmcp::apps {

// Option describes a single command-line flag accepted by an app.
// Config is the caller-defined configuration struct that handlers populate.
//
// handler returns nullopt on success, or a message describing why the value
// was rejected. Parsing continues after a rejected value so every problem is
// reported in one run.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<std::optional<std::string>(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

template <typename Config>
struct ParsedOptions {
  Config config;                      // NOLINT(readability-identifier-naming)
  std::vector<std::string> errors;    // NOLINT(readability-identifier-naming)
  std::vector<std::string> warnings;  // NOLINT(readability-identifier-naming)
  bool help_requested{false};         // NOLINT(readability-identifier-naming)
};

// parse_options iterates argv[1..argc-1] and dispatches each recognised flag
// to its handler. "--help" and "-h" are always recognised.
// Missing values and handler rejections are collected in errors. Unknown flags
// are skipped and reported in warnings.
template <typename Config>
ParsedOptions<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                    const std::vector<Option<Config>>& options,
                                    Config default_config = {}) {
  ParsedOptions<Config> parsed{std::move(default_config), {}, {}, false};

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    if (arg == "--help" || arg == "-h") {
      parsed.help_requested = true;
      continue;
    }

    auto it = option_map.find(arg);
    if (it == option_map.end()) {
      parsed.warnings.push_back("Unknown option: " + arg);
      continue;
    }

    const Option<Config>* opt = it->second;
    std::string value;
    if (opt->requires_value) {
      if (i + 1 >= argc) {
        parsed.errors.push_back("Option " + arg + " requires a value");
        continue;
      }
      value = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    }

    if (auto error = opt->handler(parsed.config, value); error.has_value()) {
      parsed.errors.push_back(std::move(error.value()));
    }
  }

  return parsed;
}

// format_usage renders a usage block listing every option with its description.
template <typename Config>
std::string format_usage(const std::string& program, const std::vector<Option<Config>>& options) {
  std::size_t width = 0;
  for (const auto& opt : options) {
    width = std::max(width, opt.name.size() + (opt.requires_value ? 8 : 0));
  }

  std::ostringstream out;
  out << "Usage: " << program << " [options]\n\nOptions:\n";
  for (const auto& opt : options) {
    std::string flag = opt.name + (opt.requires_value ? " <value>" : "");
    flag.resize(width, ' ');
    out << "  " << flag << "  " << opt.description << "\n";
  }
  out << "  " << std::string("--help").append(width - std::min<std::size_t>(width, 6), ' ')
      << "  Show this message and exit\n";
  return out.str();
}

}  // namespace wxmcp::apps
