#include "decode.h"

#include "flakeid/core/time.h"

#include "config.h"
#include "decode_logic.h"
#include "shared/arg_parser.h"
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

using flakeid::cli::DecodeCliConfig;

int cmd_decode(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  // Usage: flakeid_cli decode <id> [--epoch <time>]
  const std::vector<flakeid::apps::Option<DecodeCliConfig>> options = {
      {"--epoch", true, "Epoch offset of the issuing generator (default Unix epoch)",
       [](DecodeCliConfig& c, const std::string& v) {
         c.epoch = v;
         return true;
       }},
  };

  DecodeCliConfig defaults;
  if (argc > 2) {
    defaults.id = argv[2];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  }
  const auto parsed = flakeid::apps::parse_options(argc, argv, options, 3, defaults);
  for (const auto& error : parsed.errors) {
    std::cerr << error << "\n";
  }
  if (!parsed.ok()) {
    return 1;
  }
  const auto& config = parsed.config;

  const std::string config_error = flakeid::cli::validate_decode_config(config);
  if (!config_error.empty()) {
    std::cerr << config_error << "\n";
    std::cerr << "Usage: flakeid_cli decode <id> [--epoch <time>]\n";
    return 1;
  }

  std::int64_t epoch_offset_millis = 0;
  if (config.epoch.has_value()) {
    epoch_offset_millis =
        flakeid::core::to_unix_millis(flakeid::core::parse_iso8601(config.epoch.value()).value());
  }

  return execute_decode(flakeid::cli::parse_int64(config.id.value()).value(), epoch_offset_millis,
                        std::cout);
}
