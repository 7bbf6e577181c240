#include "kernel/session_log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

#include <iostream>

namespace graphos {

std::shared_ptr<spdlog::logger> make_null_logger() {
  auto sink = std::make_shared<spdlog::sinks::null_sink_mt>();
  return std::make_shared<spdlog::logger>("graphos", sink);
}

std::shared_ptr<spdlog::logger> make_session_logger(const std::string& path,
                                                    const std::string& level) {
  std::shared_ptr<spdlog::logger> logger;
  try {
    // Not registered globally: a second session in the same process would
    // otherwise collide on the name.
    auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, false);
    logger = std::make_shared<spdlog::logger>("graphos", sink);
  } catch (const spdlog::spdlog_ex& e) {
    std::cerr << "Warning: Could not open log file '" << path
              << "': " << e.what() << std::endl;
    return make_null_logger();
  }
  logger->set_level(spdlog::level::from_str(level));
  logger->flush_on(spdlog::level::warn);
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
  logger->info("Session log opened. file={}", path);
  return logger;
}

}  // namespace graphos
