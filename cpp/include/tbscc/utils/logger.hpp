// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <source_location>
#include <string>
#include <tbscc/config.hpp>

namespace tbscc::utils {

/**
 * @enum LogLevel
 * @brief Severity levels understood by the tbscc logger
 */
enum class LogLevel {
  trace,     ///< Per-call tracing (function entry)
  debug,     ///< Per-iteration diagnostics
  info,      ///< Run summaries
  warn,      ///< Recoverable problems (e.g. SCC not converged)
  error,     ///< Failures about to be reported as exceptions
  critical,  ///< Unrecoverable failures
  off        ///< No output
};

/**
 * @class Logger
 * @brief Process-wide spdlog logger used by every tbscc component
 *
 * A single colored stdout logger named "tbscc" is created lazily on first
 * use. Its level starts at the compile-time default `TBSCC_LOG_LEVEL` and can
 * be changed at runtime with set_global_level().
 *
 * Messages emitted through the TBSCC_LOGGER() macro carry the emitting source
 * file as a colon separated context, for example
 *
 * ```
 * [2026-10-18 10:30:00.123456] [debug] [tbscc:algorithms:scc] iter 3 ...
 * ```
 *
 * Logging never feeds back into numerical state; it is safe to call from
 * inside the SCC loop and from OpenMP regions (spdlog "_mt" sinks).
 */
class Logger {
 public:
  /**
   * @brief Access the global logger, creating it on first use
   * @return Shared pointer to the "tbscc" spdlog logger
   */
  static std::shared_ptr<spdlog::logger> get();

  /**
   * @brief Set the minimum severity that is emitted
   * @param level New global level
   */
  static void set_global_level(LogLevel level);

  /**
   * @brief Current global level
   */
  static LogLevel get_global_level();

  /**
   * @brief Colon separated context for a source location
   *
   * The path is cut at the "tbscc" directory and the extension dropped, so
   * cpp/src/tbscc/algorithms/scc.cpp becomes "tbscc:algorithms:scc".
   *
   * @param location Source location (defaults to the caller)
   * @return Context string, or "unknown" outside the tbscc tree
   */
  static std::string get_source_context(
      const std::source_location& location = std::source_location::current());
};

/**
 * @brief Trace-level "Entering <method>" message for the calling function
 *
 * Usually reached through TBSCC_LOG_TRACE_ENTERING().
 */
void log_trace_entering(
    const std::source_location& location = std::source_location::current());

/**
 * @class ContextLogger
 * @brief Forwards to the global logger with the call site's context prepended
 */
class ContextLogger {
 public:
  explicit ContextLogger(const std::source_location& loc)
      : context_(Logger::get_source_context(loc)) {}

  template <typename... Args>
  void trace(fmt::format_string<Args...> fmt, Args&&... args) {
    Logger::get()->trace("[{}] {}", context_,
                         fmt::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args>
  void debug(fmt::format_string<Args...> fmt, Args&&... args) {
    Logger::get()->debug("[{}] {}", context_,
                         fmt::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args>
  void info(fmt::format_string<Args...> fmt, Args&&... args) {
    Logger::get()->info("[{}] {}", context_,
                        fmt::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args>
  void warn(fmt::format_string<Args...> fmt, Args&&... args) {
    Logger::get()->warn("[{}] {}", context_,
                        fmt::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args>
  void error(fmt::format_string<Args...> fmt, Args&&... args) {
    Logger::get()->error("[{}] {}", context_,
                         fmt::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args>
  void critical(fmt::format_string<Args...> fmt, Args&&... args) {
    Logger::get()->critical("[{}] {}", context_,
                            fmt::format(fmt, std::forward<Args>(args)...));
  }

  void trace(const std::string& msg) {
    Logger::get()->trace("[{}] {}", context_, msg);
  }
  void debug(const std::string& msg) {
    Logger::get()->debug("[{}] {}", context_, msg);
  }
  void info(const std::string& msg) {
    Logger::get()->info("[{}] {}", context_, msg);
  }
  void warn(const std::string& msg) {
    Logger::get()->warn("[{}] {}", context_, msg);
  }
  void error(const std::string& msg) {
    Logger::get()->error("[{}] {}", context_, msg);
  }
  void critical(const std::string& msg) {
    Logger::get()->critical("[{}] {}", context_, msg);
  }

 private:
  std::string context_;
};

}  // namespace tbscc::utils

/**
 * @def TBSCC_LOGGER()
 * @brief Context-aware logger for the current source location
 *
 * ```cpp
 * TBSCC_LOGGER().info("SCC converged after {} iterations", n);
 * ```
 */
#define TBSCC_LOGGER() \
  tbscc::utils::ContextLogger(std::source_location::current())

/**
 * @def TBSCC_RAW_LOGGER()
 * @brief The underlying spdlog logger, without context prefix
 */
#define TBSCC_RAW_LOGGER() tbscc::utils::Logger::get()

/**
 * @def TBSCC_LOG_TRACE_ENTERING()
 * @brief Trace function entry; compiled out with TBSCC_DISABLE_TRACE_LOG
 */
#ifdef TBSCC_DISABLE_TRACE_LOG
#define TBSCC_LOG_TRACE_ENTERING() ((void)0)
#else
#define TBSCC_LOG_TRACE_ENTERING() tbscc::utils::log_trace_entering()
#endif
