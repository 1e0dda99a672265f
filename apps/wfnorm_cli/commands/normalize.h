#pragma once

// cmd_normalize: normalize an identifier given as argument, or one per line with --stdin
int cmd_normalize(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
