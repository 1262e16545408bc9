#pragma once

#include <cstdint>
#include <iosfwd>

// execute_decode: print the decoded fields of id as JSON.
// epoch_offset_millis is the offset of the generator that issued id (0 for none).
int execute_decode(std::int64_t id, std::int64_t epoch_offset_millis, std::ostream& out);
