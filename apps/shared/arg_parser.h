#pragma once

#include <functional>
#include <ostream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace flakeid::apps {

// Option describes a single command-line flag accepted by a subcommand.
// Config is the caller-defined configuration struct that handlers populate.
//
// handler returns false to reject the value; the rejection is recorded in
// ParsedOptions::errors and parsing continues with the next flag.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

template <typename Config>
struct ParsedOptions {
  Config config;                    // NOLINT(readability-identifier-naming)
  std::vector<std::string> errors;  // NOLINT(readability-identifier-naming)

  [[nodiscard]] bool ok() const { return errors.empty(); }
};

// parse_options walks argv[start..argc-1] and dispatches each recognised flag
// to its handler. Non-flag tokens are skipped so callers can read positional
// arguments themselves. Unknown flags, missing values and rejected values are
// collected as errors rather than printed.
template <typename Config>
ParsedOptions<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                    const std::vector<Option<Config>>& options, int start = 1,
                                    Config default_config = {}) {
  ParsedOptions<Config> parsed{std::move(default_config), {}};

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    const std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    auto it = option_map.find(arg);
    if (it == option_map.end()) {
      if (!arg.empty() && arg[0] == '-') {
        parsed.errors.push_back("Unknown option: " + arg);
      }
      continue;
    }

    const Option<Config>* opt = it->second;
    if (!opt->requires_value) {
      opt->handler(parsed.config, "");
      continue;
    }
    if (i + 1 >= argc) {
      parsed.errors.push_back("Option " + arg + " requires a value");
      continue;
    }
    const std::string value = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    if (!opt->handler(parsed.config, value)) {
      parsed.errors.push_back("Invalid value for " + arg + ": " + value);
    }
  }

  return parsed;
}

// print_options writes one entry per flag: the name, then its description indented below.
template <typename Config>
void print_options(std::ostream& out, const std::vector<Option<Config>>& options) {
  for (const auto& opt : options) {
    out << "  " << opt.name << (opt.requires_value ? " <value>" : "") << "\n      "
        << opt.description << "\n";
  }
}

}  // namespace flakeid::apps
