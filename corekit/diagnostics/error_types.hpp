/*
 * Copyright 2025 Jinwoo Sung
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <algorithm>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <cstddef>
#include <ctime>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <string>

namespace corekit {
namespace diagnostics {

/**
 * @brief Error severity levels
 */
enum class ErrorLevel {
  INFO = 0,     // Informational message
  WARNING = 1,  // Recoverable issue
  ERROR = 2,    // Operation failed
  CRITICAL = 3  // Invariant broken
};

/**
 * @brief Error categories for classification
 */
enum class ErrorCategory {
  VALIDATION = 0,       // Argument validation
  LIFECYCLE = 1,        // Disposal hooks
  SYNCHRONIZATION = 2,  // Semaphore waits, cancellation
  CONFIGURATION = 3,    // Invalid config values or files
  SYSTEM = 4,           // OS level errors
  UNKNOWN = 5
};

/**
 * @brief Error record delivered to ErrorHandler callbacks
 */
struct ErrorInfo {
  ErrorLevel level;
  ErrorCategory category;
  std::string component;                            // disposable, semaphore, config, ...
  std::string operation;                            // dispose, async_acquire, load, ...
  std::string message;
  boost::system::error_code boost_error;
  std::chrono::system_clock::time_point timestamp;
  std::string context;

  ErrorInfo(ErrorLevel l, ErrorCategory c, const std::string& comp, const std::string& op, const std::string& msg)
      : level(l), category(c), component(comp), operation(op), message(msg), timestamp(std::chrono::system_clock::now()) {}

  ErrorInfo(ErrorLevel l, ErrorCategory c, const std::string& comp, const std::string& op, const std::string& msg,
            const boost::system::error_code& ec)
      : level(l),
        category(c),
        component(comp),
        operation(op),
        message(msg),
        boost_error(ec),
        timestamp(std::chrono::system_clock::now()) {}

  std::string get_timestamp_string() const {
    auto time_t = std::chrono::system_clock::to_time_t(timestamp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()) % 1000;

    std::tm time_info{};
#if defined(_WIN32)
    ::localtime_s(&time_info, &time_t);
#else
    ::localtime_r(&time_t, &time_info);
#endif
    std::ostringstream oss;
    oss << std::put_time(&time_info, "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
  }

  std::string get_level_string() const {
    switch (level) {
      case ErrorLevel::INFO:
        return "INFO";
      case ErrorLevel::WARNING:
        return "WARNING";
      case ErrorLevel::ERROR:
        return "ERROR";
      case ErrorLevel::CRITICAL:
        return "CRITICAL";
    }
    return "UNKNOWN";
  }

  std::string get_category_string() const {
    switch (category) {
      case ErrorCategory::VALIDATION:
        return "VALIDATION";
      case ErrorCategory::LIFECYCLE:
        return "LIFECYCLE";
      case ErrorCategory::SYNCHRONIZATION:
        return "SYNCHRONIZATION";
      case ErrorCategory::CONFIGURATION:
        return "CONFIGURATION";
      case ErrorCategory::SYSTEM:
        return "SYSTEM";
      case ErrorCategory::UNKNOWN:
        return "UNKNOWN";
    }
    return "UNKNOWN";
  }

  std::string get_summary() const {
    std::ostringstream oss;
    oss << "[" << get_level_string() << "] " << "[" << component << "] " << "[" << operation << "] " << message;

    if (boost_error) {
      oss << " (boost: " << boost_error.message() << ", code: " << boost_error.value() << ")";
    }

    return oss.str();
  }
};

/**
 * @brief Error statistics for monitoring
 */
struct ErrorStats {
  size_t total_errors = 0;
  size_t errors_by_level[4] = {0, 0, 0, 0};           // INFO, WARNING, ERROR, CRITICAL
  size_t errors_by_category[6] = {0, 0, 0, 0, 0, 0};  // VALIDATION, LIFECYCLE, ...

  std::chrono::system_clock::time_point first_error;
  std::chrono::system_clock::time_point last_error;

  void reset() {
    total_errors = 0;
    std::fill(std::begin(errors_by_level), std::end(errors_by_level), 0);
    std::fill(std::begin(errors_by_category), std::end(errors_by_category), 0);
    first_error = std::chrono::system_clock::time_point{};
    last_error = std::chrono::system_clock::time_point{};
  }
};

}  // namespace diagnostics
}  // namespace corekit
