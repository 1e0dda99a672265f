#pragma once

#include "wfnorm/core/log.h"

#include <iostream>
#include <string>

// apply_log_level_flag: shared handler body for --log-level.
inline bool apply_log_level_flag(const std::string& value) {
  const auto level = wfnorm::core::parse_log_level(value);
  if (!level.has_value()) {
    std::cerr << "Invalid --log-level: " << value
              << " (valid: trace, debug, info, warn, error, off)\n";
    return false;
  }
  wfnorm::core::set_log_level(level.value());
  return true;
}
