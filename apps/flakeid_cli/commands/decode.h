#pragma once

// cmd_decode: print the timestamp, data center, worker and sequence fields of an id
int cmd_decode(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
