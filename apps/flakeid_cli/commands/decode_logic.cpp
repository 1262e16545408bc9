#include "decode_logic.h"

#include "flakeid/snowflake/id_json.h"

#include <ostream>

int execute_decode(const std::int64_t id, const std::int64_t epoch_offset_millis,
                   std::ostream& out) {
  out << flakeid::snowflake::id_to_json(id, epoch_offset_millis).dump(2) << "\n";
  return 0;
}
