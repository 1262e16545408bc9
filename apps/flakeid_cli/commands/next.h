#pragma once

// cmd_next: issue identifiers from a generator configured by --data-center/--worker/--epoch
int cmd_next(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
