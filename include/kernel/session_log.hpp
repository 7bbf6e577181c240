#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace graphos {

// File logger for a session. Falls back to a logger with a null sink when
// `path` cannot be opened, so callers never have to check. `level` is an
// spdlog level name ("info", "debug", ...).
std::shared_ptr<spdlog::logger> make_session_logger(const std::string& path,
                                                    const std::string& level);

// Logger that drops everything. Used by tests.
std::shared_ptr<spdlog::logger> make_null_logger();

}  // namespace graphos
