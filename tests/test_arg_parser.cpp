#include <catch2/catch_test_macros.hpp>

#include "shared/arg_parser.h"
#include <optional>
#include <string>
#include <utility>
#include <vector>

using flakeid::apps::Option;
using flakeid::apps::parse_options;

namespace {

struct DemoConfig {
  std::optional<std::string> name;
  int level{0};
  bool verbose{false};
};

std::vector<Option<DemoConfig>> demo_options() {
  return {
      {"--name", true, "Name",
       [](DemoConfig& c, const std::string& v) {
         c.name = v;
         return true;
       }},
      {"--level", true, "Level 0-9",
       [](DemoConfig& c, const std::string& v) {
         if (v.size() != 1 || v[0] < '0' || v[0] > '9') {
           return false;
         }
         c.level = v[0] - '0';
         return true;
       }},
      {"--verbose", false, "Verbose",
       [](DemoConfig& c, const std::string& /*v*/) {
         c.verbose = true;
         return true;
       }},
  };
}

// argv arrays must be mutable char* for the parser signature.
struct Argv {
  explicit Argv(std::vector<std::string> args) : storage(std::move(args)) {
    for (auto& a : storage) {
      pointers.push_back(a.data());
    }
  }
  int argc() const { return static_cast<int>(pointers.size()); }
  char** argv() { return pointers.data(); }

  std::vector<std::string> storage;
  std::vector<char*> pointers;
};

}  // namespace

TEST_CASE("parse_options: recognised flags populate the config", "[cli][args]") {
  Argv args({"flakeid_cli", "next", "--name", "east", "--level", "4", "--verbose"});
  const auto parsed = parse_options(args.argc(), args.argv(), demo_options(), 2);

  REQUIRE(parsed.ok());
  CHECK(parsed.config.name == "east");
  CHECK(parsed.config.level == 4);
  CHECK(parsed.config.verbose);
}

TEST_CASE("parse_options: positional tokens are skipped", "[cli][args]") {
  Argv args({"flakeid_cli", "decode", "12345", "--level", "2"});
  const auto parsed = parse_options(args.argc(), args.argv(), demo_options(), 2);

  REQUIRE(parsed.ok());
  CHECK(parsed.config.level == 2);
  CHECK_FALSE(parsed.config.name.has_value());
}

TEST_CASE("parse_options: problems are collected as errors", "[cli][args]") {
  SECTION("unknown flag") {
    Argv args({"flakeid_cli", "next", "--colour", "red"});
    const auto parsed = parse_options(args.argc(), args.argv(), demo_options(), 2);
    REQUIRE(parsed.errors.size() == 1);
    CHECK(parsed.errors[0] == "Unknown option: --colour");
  }

  SECTION("missing value") {
    Argv args({"flakeid_cli", "next", "--name"});
    const auto parsed = parse_options(args.argc(), args.argv(), demo_options(), 2);
    REQUIRE(parsed.errors.size() == 1);
    CHECK(parsed.errors[0] == "Option --name requires a value");
  }

  SECTION("rejected value") {
    Argv args({"flakeid_cli", "next", "--level", "high", "--verbose"});
    const auto parsed = parse_options(args.argc(), args.argv(), demo_options(), 2);
    REQUIRE(parsed.errors.size() == 1);
    CHECK(parsed.errors[0] == "Invalid value for --level: high");
    CHECK(parsed.config.level == 0);
    CHECK(parsed.config.verbose);
  }
}

TEST_CASE("parse_options: defaults are kept for absent flags", "[cli][args]") {
  Argv args({"flakeid_cli", "next"});
  DemoConfig defaults;
  defaults.level = 7;
  const auto parsed = parse_options(args.argc(), args.argv(), demo_options(), 2, defaults);

  REQUIRE(parsed.ok());
  CHECK(parsed.config.level == 7);
}
