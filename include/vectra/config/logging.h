#pragma once

#include <string>

#include <vectra/core/types.h>

namespace vectra::config {

// Installs a default spdlog logger named `name` writing to stderr and, when
// `logFile` is non-empty, to that file, truncated first. Returns WriteError if the
// file cannot be opened; the previous default logger is left in place.
Result<void> setup_logging(const std::string& name, const std::string& level,
                           const std::string& logFile);

} // namespace vectra::config
