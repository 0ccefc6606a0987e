#pragma once

#include <memory>
#include <sstream>

#include <spdlog/spdlog.h>

namespace tschnorr {

struct LoggingConfig {
  spdlog::level::level_enum level = spdlog::level::warn;
};

// Shared "tschnorr" logger writing to stderr. Created on first use and safe to
// call from any thread.
std::shared_ptr<spdlog::logger> GetLogger();

void ConfigureLogging(const LoggingConfig& config);

}  // namespace tschnorr

#define TSCHNORR_LOG_AT(level_enum, method, s)       \
  {                                                  \
    auto tschnorr_logger_ = ::tschnorr::GetLogger(); \
    if (tschnorr_logger_->should_log(level_enum)) {  \
      std::ostringstream ss;                         \
      ss << s;                                       \
      tschnorr_logger_->method(ss.str());            \
    }                                                \
  }

#define TSCHNORR_LOG_TRACE(s) TSCHNORR_LOG_AT(spdlog::level::trace, trace, s)
#define TSCHNORR_LOG_DEBUG(s) TSCHNORR_LOG_AT(spdlog::level::debug, debug, s)
#define TSCHNORR_LOG_INFO(s) TSCHNORR_LOG_AT(spdlog::level::info, info, s)
#define TSCHNORR_LOG_WARN(s) TSCHNORR_LOG_AT(spdlog::level::warn, warn, s)
#define TSCHNORR_LOG_ERROR(s) TSCHNORR_LOG_AT(spdlog::level::err, error, s)
