#pragma once

#include <string>

namespace attendance {

// Console + file logger used by the node. Throws ConfigError on an unknown
// level name.
void setup_logging(const std::string& log_file, const std::string& level);

// stderr-only logger for single-shot tools whose stdout carries the result.
void setup_stderr_logging(const std::string& level);

}  // namespace attendance
