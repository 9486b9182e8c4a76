#pragma once

#include "runlog/logging/logger.h"

// Location-aware logging through an explicit logger (any pointer-like
// handle to runlog::logging::Logger). Arguments are only evaluated when the
// logger's level lets the record through.
#ifdef RUNLOG_LOG_DISABLE
#define RUNLOG_LOG(logger, level, ...) ((void)0)
#else
#define RUNLOG_LOG(logger, level, ...)                                     \
  do {                                                                     \
    auto&& runlog_logger_ = (logger);                                      \
    if (runlog_logger_->shouldLog(::runlog::logging::LogLevel::level)) {   \
      runlog_logger_->log(::runlog::logging::LogLevel::level, __FILE__,    \
                          __LINE__, __FUNCTION__, __VA_ARGS__);            \
    }                                                                      \
  } while (0)
#endif

// Quick logging macros
#define RUNLOG_DEBUG(logger, ...) RUNLOG_LOG(logger, Debug, __VA_ARGS__)
#define RUNLOG_INFO(logger, ...) RUNLOG_LOG(logger, Info, __VA_ARGS__)
#define RUNLOG_WARNING(logger, ...) RUNLOG_LOG(logger, Warning, __VA_ARGS__)
#define RUNLOG_ERROR(logger, ...) RUNLOG_LOG(logger, Error, __VA_ARGS__)
#define RUNLOG_CRITICAL(logger, ...) RUNLOG_LOG(logger, Critical, __VA_ARGS__)

// Source location helper
#define RUNLOG_LOCATION __FILE__, __LINE__, __FUNCTION__
