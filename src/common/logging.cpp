#include "tschnorr/common/logging.hpp"

#include <spdlog/sinks/stdout_sinks.h>

namespace tschnorr {
namespace {

constexpr char kLoggerName[] = "tschnorr";

}  // namespace

std::shared_ptr<spdlog::logger> GetLogger() {
  static const std::shared_ptr<spdlog::logger> logger = []() {
    std::shared_ptr<spdlog::logger> existing = spdlog::get(kLoggerName);
    if (existing != nullptr) {
      return existing;
    }
    std::shared_ptr<spdlog::logger> created = spdlog::stderr_logger_mt(kLoggerName);
    created->set_level(LoggingConfig{}.level);
    return created;
  }();
  return logger;
}

void ConfigureLogging(const LoggingConfig& config) {
  GetLogger()->set_level(config.level);
}

}  // namespace tschnorr
