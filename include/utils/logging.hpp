#pragma once

#include <cstdlib>
#include <iostream>
#include <unistd.h>

// Daemon and CLI usually share one terminal, so every line carries the pid.
#define STAGELINK_LOG_PREFIX(tag) "[" tag " " << ::getpid() << "] "

// Always-on logging for important messages (works in release too)
#define LOG(msg) do { \
  std::cout << STAGELINK_LOG_PREFIX("LOG") << msg << std::endl; \
} while(0)

// Debug logging levels
#ifdef DEBUG_BUILD
  #define DEBUG_INFO(msg) do { \
    std::cout << STAGELINK_LOG_PREFIX("INFO") << msg << std::endl; \
  } while(0)

  #define DEBUG_DEBUG(msg) do { \
    std::cout << STAGELINK_LOG_PREFIX("DEBUG") << msg << std::endl; \
  } while(0)

  #define DEBUG_WARN(msg) do { \
    std::cerr << STAGELINK_LOG_PREFIX("WARN") << msg << std::endl; \
  } while(0)

  #define DEBUG_ERROR(msg) do { \
    std::cerr << STAGELINK_LOG_PREFIX("ERROR") << msg << std::endl; \
  } while(0)
#else
  // All debug macros become no-ops in release
  #define DEBUG_INFO(msg) ((void)0)
  #define DEBUG_DEBUG(msg) ((void)0)
  #define DEBUG_WARN(msg) ((void)0)
  #define DEBUG_ERROR(msg) ((void)0)
#endif

// Errors that reach the operator regardless of build type
#define LOG_ERROR(msg) do { \
  std::cerr << STAGELINK_LOG_PREFIX("ERROR") << msg << std::endl; \
} while(0)

// Always log errors and exit (even in release)
#define LOG_AND_EXIT(msg, code) do { \
  std::cerr << STAGELINK_LOG_PREFIX("FATAL") << msg << std::endl; \
  std::exit(code); \
} while(0)
