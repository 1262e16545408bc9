#pragma once

#include "flakeid/snowflake/generator.h"

#include <cstdint>
#include <iosfwd>

// execute_next: issue `count` identifiers from generator and print them to out,
// one decimal id per line, or as a single JSON document when as_json is set.
// Returns 0 on success, 1 (after writing the reason to err) if the generator refuses an id.
int execute_next(flakeid::snowflake::Generator& generator, std::int64_t count, bool as_json,
                 std::ostream& out, std::ostream& err);
