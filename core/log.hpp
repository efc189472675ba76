// filename: core/log.hpp
#pragma once
#include <spdlog/spdlog.h>
#include <string_view>

// Component tags go in the message text, as in "[server] listening on ...".

// Case-insensitive; "warning" and "error" are accepted. Unknown names map to info.
spdlog::level::level_enum parse_log_level(std::string_view name);

// Installs the process-wide "smql" logger on stdout with the given threshold.
// Warnings and errors are flushed as they are written.
void init_logging(spdlog::level::level_enum level);
