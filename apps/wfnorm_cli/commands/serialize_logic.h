#pragma once

#include <iostream>
#include <string>

// execute_serialize: decode a StructuredUri JSON object and print its canonical form.
// Returns 1 (with a message on err) for malformed JSON or an invalid component.
int execute_serialize(const std::string& json_text, std::ostream& out, std::ostream& err);
