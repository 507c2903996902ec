// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT License. See LICENSE.txt in the project root for
// license information.

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <source_location>
#include <string>
#include <string_view>
#include <tbscc/config.hpp>
#include <tbscc/utils/logger.hpp>
#include <vector>

namespace tbscc::utils {

namespace {

constexpr const char* logger_name = "tbscc";

constexpr spdlog::level::level_enum default_level_from_config() {
  switch (TBSCC_LOG_LEVEL) {
    case 0:
      return spdlog::level::trace;
    case 1:
      return spdlog::level::debug;
    case 2:
      return spdlog::level::info;
    case 3:
      return spdlog::level::warn;
    case 4:
      return spdlog::level::err;
    case 5:
      return spdlog::level::critical;
    case 6:
      return spdlog::level::off;
    default:
      return spdlog::level::info;
  }
}

spdlog::level::level_enum g_global_level = default_level_from_config();
std::mutex g_level_mutex;

std::shared_ptr<spdlog::logger> g_logger;
std::once_flag g_logger_init_flag;

// "…/cpp/src/tbscc/algorithms/scc.cpp" -> "tbscc:algorithms:scc"
std::string path_to_context(std::string_view file_path) {
  constexpr std::string_view segment = "tbscc/";
  size_t pos = file_path.rfind(std::string("/") + std::string(segment));
  if (pos == std::string_view::npos) {
    if (file_path.substr(0, segment.size()) != segment) return "";
    pos = 0;
  } else {
    pos += 1;
  }

  std::string_view relevant = file_path.substr(pos);
  const size_t dot = relevant.find_last_of('.');
  const size_t slash = relevant.find_last_of('/');
  if (dot != std::string_view::npos &&
      (slash == std::string_view::npos || dot > slash)) {
    relevant = relevant.substr(0, dot);
  }

  std::string context;
  context.reserve(relevant.size());
  bool pending_separator = false;
  for (char c : relevant) {
    if (c == '/') {
      pending_separator = !context.empty();
      continue;
    }
    if (pending_separator) {
      context.push_back(':');
      pending_separator = false;
    }
    context.push_back(c);
  }
  return context;
}

// "tbscc::algorithms::SccDriver::run(...)" -> "run"
std::string extract_method_name(std::string_view func_name) {
  std::string full_name(func_name);
  if (const size_t lambda = full_name.find("::<lambda");
      lambda != std::string::npos) {
    full_name = full_name.substr(0, lambda);
  }
  if (const size_t paren = full_name.find('('); paren != std::string::npos) {
    full_name = full_name.substr(0, paren);
  }

  const size_t last_colons = full_name.rfind("::");
  std::string name = (last_colons != std::string::npos)
                         ? full_name.substr(last_colons + 2)
                         : full_name;
  // Drop a leading return type, e.g. "void run"
  if (const size_t space = name.rfind(' '); space != std::string::npos) {
    name = name.substr(space + 1);
  }

  if (last_colons != std::string::npos) {
    const size_t previous = full_name.rfind("::", last_colons - 1);
    std::string owner =
        (previous != std::string::npos)
            ? full_name.substr(previous + 2, last_colons - previous - 2)
            : full_name.substr(0, last_colons);
    if (owner == name) name += " constructor";
  }
  return name;
}

spdlog::level::level_enum to_spdlog_level(LogLevel level) {
  switch (level) {
    case LogLevel::trace:
      return spdlog::level::trace;
    case LogLevel::debug:
      return spdlog::level::debug;
    case LogLevel::info:
      return spdlog::level::info;
    case LogLevel::warn:
      return spdlog::level::warn;
    case LogLevel::error:
      return spdlog::level::err;
    case LogLevel::critical:
      return spdlog::level::critical;
    case LogLevel::off:
      return spdlog::level::off;
  }
  return spdlog::level::info;
}

LogLevel from_spdlog_level(spdlog::level::level_enum level) {
  switch (level) {
    case spdlog::level::trace:
      return LogLevel::trace;
    case spdlog::level::debug:
      return LogLevel::debug;
    case spdlog::level::info:
      return LogLevel::info;
    case spdlog::level::warn:
      return LogLevel::warn;
    case spdlog::level::err:
      return LogLevel::error;
    case spdlog::level::critical:
      return LogLevel::critical;
    case spdlog::level::off:
      return LogLevel::off;
    default:
      return LogLevel::info;
  }
}

void init_global_logger() {
  try {
    g_logger = spdlog::stdout_color_mt(logger_name);
  } catch (const spdlog::spdlog_ex&) {
    // Already registered (e.g. by an embedding application)
    g_logger = spdlog::get(logger_name);
  }

  if (g_logger) {
    std::lock_guard<std::mutex> lock(g_level_mutex);
    g_logger->set_level(g_global_level);
    g_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%f] [%^%l%$] %v");
  }
}

}  // namespace

std::shared_ptr<spdlog::logger> Logger::get() {
  std::call_once(g_logger_init_flag, init_global_logger);

  if (g_logger) {
    std::lock_guard<std::mutex> lock(g_level_mutex);
    if (g_logger->level() != g_global_level) {
      g_logger->set_level(g_global_level);
    }
  }
  return g_logger;
}

void Logger::set_global_level(LogLevel level) {
  const auto spdlog_level = to_spdlog_level(level);
  std::lock_guard<std::mutex> lock(g_level_mutex);
  g_global_level = spdlog_level;
  if (g_logger) g_logger->set_level(spdlog_level);
}

LogLevel Logger::get_global_level() {
  std::lock_guard<std::mutex> lock(g_level_mutex);
  return from_spdlog_level(g_global_level);
}

std::string Logger::get_source_context(const std::source_location& location) {
  std::string context = path_to_context(location.file_name());
  return context.empty() ? "unknown" : context;
}

void log_trace_entering(const std::source_location& location) {
  std::string context = path_to_context(location.file_name());
  std::string method = extract_method_name(location.function_name());
  if (context.empty()) context = "unknown";
  if (method.empty()) method = "unknown";
  Logger::get()->trace("[{}] Entering {}", context, method);
}

}  // namespace tbscc::utils
