#include "next.h"

#include "flakeid/core/time.h"
#include "flakeid/snowflake/generator.h"
#include "flakeid/snowflake/options.h"

#include "config.h"
#include "next_logic.h"
#include "shared/arg_parser.h"
#include <iostream>
#include <string>
#include <vector>

using flakeid::cli::NextCliConfig;

namespace {

std::vector<flakeid::apps::Option<NextCliConfig>> next_options() {
  return {
      {"--data-center", true, "Data center id in [0, 31] (default 0)",
       [](NextCliConfig& c, const std::string& v) {
         c.data_center = v;
         return true;
       }},
      {"--worker", true, "Worker id in [0, 31] (default 0)",
       [](NextCliConfig& c, const std::string& v) {
         c.worker = v;
         return true;
       }},
      {"--machine", true, "Alias of --worker",
       [](NextCliConfig& c, const std::string& v) {
         c.worker = v;
         return true;
       }},
      {"--epoch", true, "Epoch offset, YYYY-MM-DD or YYYY-MM-DDTHH:MM:SSZ (default Unix epoch)",
       [](NextCliConfig& c, const std::string& v) {
         c.epoch = v;
         return true;
       }},
      {"--count", true, "Number of ids to issue (default 1)",
       [](NextCliConfig& c, const std::string& v) {
         c.count = v;
         return true;
       }},
      {"--json", false, "Print a JSON document instead of one id per line",
       [](NextCliConfig& c, const std::string& /*v*/) {
         c.json = true;
         return true;
       }},
  };
}

// Flags were validated already, so every parse below succeeds.
std::vector<flakeid::snowflake::Option> to_generator_options(const NextCliConfig& config) {
  std::vector<flakeid::snowflake::Option> options;
  if (config.data_center.has_value()) {
    options.push_back(flakeid::snowflake::with_data_center(
        flakeid::cli::parse_int64(config.data_center.value()).value()));
  }
  if (config.worker.has_value()) {
    options.push_back(
        flakeid::snowflake::with_worker(flakeid::cli::parse_int64(config.worker.value()).value()));
  }
  if (config.epoch.has_value()) {
    options.push_back(
        flakeid::snowflake::with_epoch(flakeid::core::parse_iso8601(config.epoch.value()).value()));
  }
  return options;
}

}  // namespace

int cmd_next(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  const auto options = next_options();
  const auto parsed = flakeid::apps::parse_options(argc, argv, options, 2);
  if (!parsed.ok()) {
    for (const auto& error : parsed.errors) {
      std::cerr << error << "\n";
    }
    std::cerr << "Usage: flakeid_cli next [options]\n";
    flakeid::apps::print_options(std::cerr, options);
    return 1;
  }
  const auto& config = parsed.config;

  const std::string config_error = flakeid::cli::validate_next_config(config);
  if (!config_error.empty()) {
    std::cerr << config_error << "\n";
    return 1;
  }

  auto created = flakeid::snowflake::Generator::create(to_generator_options(config));
  if (!created.has_value()) {
    std::cerr << "Error: invalid generator configuration: " << created.error().message() << "\n";
    return 1;
  }
  auto& generator = *created.value();

  if (generator.config().uses_default_identity()) {
    std::cerr << "WARNING: No --data-center/--worker specified. Using node identity 0/0.\n"
                 "         Ids are only unique if no other node issues with the same identity.\n";
  }

  return execute_next(generator, flakeid::cli::parse_int64(config.count).value(), config.json,
                      std::cout, std::cerr);
}
