#pragma once

#include "conductor/logging/logger_registry.h"

// Source files name their logger before including this header:
//   #define CONDUCTOR_LOG_COMPONENT "transport.stdio"
#ifndef CONDUCTOR_LOG_COMPONENT
#define CONDUCTOR_LOG_COMPONENT "default"
#endif

#ifdef CONDUCTOR_LOG_DISABLE
#define CONDUCTOR_LOG(level, ...) ((void)0)
#define CONDUCTOR_LOG_CTX(level, context, ...) ((void)0)
#else
#define CONDUCTOR_LOG(level, ...)                                          \
  do {                                                                     \
    auto conductor_logger_ =                                               \
        ::conductor::logging::LoggerRegistry::instance().getOrCreateLogger( \
            CONDUCTOR_LOG_COMPONENT);                                      \
    if (conductor_logger_->shouldLog(                                      \
            ::conductor::logging::LogLevel::level)) {                      \
      conductor_logger_->log(::conductor::logging::LogLevel::level,        \
                             __FILE__, __LINE__, __FUNCTION__,             \
                             __VA_ARGS__);                                 \
    }                                                                      \
  } while (0)

// Attaches service/tool/request correlation fields to the record
#define CONDUCTOR_LOG_CTX(level, context, ...)                             \
  do {                                                                     \
    auto conductor_logger_ =                                               \
        ::conductor::logging::LoggerRegistry::instance().getOrCreateLogger( \
            CONDUCTOR_LOG_COMPONENT);                                      \
    if (conductor_logger_->shouldLog(                                      \
            ::conductor::logging::LogLevel::level)) {                      \
      conductor_logger_->logWithContext(                                   \
          ::conductor::logging::LogLevel::level, context, __FILE__,        \
          __LINE__, __FUNCTION__, __VA_ARGS__);                            \
    }                                                                      \
  } while (0)
#endif
