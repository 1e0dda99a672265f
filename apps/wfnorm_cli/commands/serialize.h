#pragma once

// cmd_serialize: print the canonical form of a StructuredUri given as --input <json>
int cmd_serialize(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
