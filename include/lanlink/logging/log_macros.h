#pragma once

#include "lanlink/logging/logger_registry.h"

// Each source file names its logger before including this header:
//   #define LANLINK_LOG_COMPONENT "server"
#ifndef LANLINK_LOG_COMPONENT
#define LANLINK_LOG_COMPONENT "default"
#endif

#define LANLINK_LOG_IMPL_(logger_expr, level, peer, ...)                  \
  do {                                                                    \
    auto lanlink_logger_ = (logger_expr);                                 \
    if (lanlink_logger_->shouldLog(::lanlink::logging::LogLevel::level)) { \
      lanlink_logger_->logAt(::lanlink::logging::LogLevel::level,         \
                             __FILE__, __LINE__, (peer), __VA_ARGS__);    \
    }                                                                     \
  } while (0)

#define LANLINK_LOG(level, ...)                                         \
  LANLINK_LOG_IMPL_(                                                    \
      ::lanlink::logging::LoggerRegistry::instance().getOrCreateLogger( \
          LANLINK_LOG_COMPONENT),                                       \
      level, std::string(), __VA_ARGS__)

// Attaches the remote endpoint ("address:port") to the record
#define LANLINK_LOG_PEER(level, peer_key, ...)                          \
  LANLINK_LOG_IMPL_(                                                    \
      ::lanlink::logging::LoggerRegistry::instance().getOrCreateLogger( \
          LANLINK_LOG_COMPONENT),                                       \
      level, (peer_key), __VA_ARGS__)

// Default logger, for the tools and other code without a component name
#define LOG_DEBUG(...)                                                    \
  LANLINK_LOG_IMPL_(                                                      \
      ::lanlink::logging::LoggerRegistry::instance().getDefaultLogger(),  \
      Debug, std::string(), __VA_ARGS__)
#define LOG_INFO(...)                                                     \
  LANLINK_LOG_IMPL_(                                                      \
      ::lanlink::logging::LoggerRegistry::instance().getDefaultLogger(),  \
      Info, std::string(), __VA_ARGS__)
#define LOG_WARNING(...)                                                  \
  LANLINK_LOG_IMPL_(                                                      \
      ::lanlink::logging::LoggerRegistry::instance().getDefaultLogger(),  \
      Warning, std::string(), __VA_ARGS__)
#define LOG_ERROR(...)                                                    \
  LANLINK_LOG_IMPL_(                                                      \
      ::lanlink::logging::LoggerRegistry::instance().getDefaultLogger(),  \
      Error, std::string(), __VA_ARGS__)
