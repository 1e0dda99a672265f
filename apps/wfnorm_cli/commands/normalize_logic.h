#pragma once

#include <iostream>
#include <string>

// execute_normalize: normalize one identifier and print its canonical form
// (or, with json, the component object plus the canonical form under "uri").
// Returns 0 on success, 1 when the identifier cannot be normalized.
int execute_normalize(const std::string& identifier, bool json, std::ostream& out,
                      std::ostream& err);

// execute_normalize_stream: normalize one identifier per input line.
// Lines are trimmed and blank lines skipped. Rejected lines print
// "!<reason> <input>" (or a JSON object with "error" and "input").
// Returns 0 when every line normalized, 1 otherwise.
int execute_normalize_stream(std::istream& in, bool json, std::ostream& out);
