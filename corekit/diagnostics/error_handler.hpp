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

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "corekit/base/visibility.hpp"
#include "corekit/diagnostics/error_types.hpp"

namespace corekit {
namespace diagnostics {

/**
 * @brief Centralized error handling system
 *
 * Collects failures that cannot be thrown to a caller (scope-exit disposal,
 * asynchronous completions) together with explicit reports from library code.
 */
class COREKIT_API ErrorHandler {
 public:
  using ErrorCallback = std::function<void(const ErrorInfo&)>;

  /**
   * @brief Get singleton instance
   */
  static ErrorHandler& instance();

  ErrorHandler();
  ~ErrorHandler();

  /**
   * @brief Report an error
   * @param error Error information to report
   */
  void report_error(const ErrorInfo& error);

  /**
   * @brief Register error callback
   * @param callback Function to call when errors occur
   */
  void register_callback(ErrorCallback callback);

  void clear_callbacks();

  /**
   * @brief Set minimum error level to report
   * @param level Minimum level (errors below this level are ignored)
   */
  void set_min_error_level(ErrorLevel level);
  ErrorLevel get_min_error_level() const;

  void set_enabled(bool enabled);
  bool is_enabled() const;

  ErrorStats get_error_stats() const;

  /**
   * @brief Reset statistics and error history
   */
  void reset_stats();

  std::vector<ErrorInfo> get_errors_by_component(const std::string& component) const;

  /**
   * @brief Get recent errors
   * @param count Maximum number of recent errors to return
   */
  std::vector<ErrorInfo> get_recent_errors(size_t count = 10) const;

  bool has_errors(const std::string& component) const;

  size_t get_error_count(const std::string& component, ErrorLevel level) const;

 private:
  ErrorHandler(const ErrorHandler&) = delete;
  ErrorHandler& operator=(const ErrorHandler&) = delete;
  ErrorHandler(ErrorHandler&&) = delete;
  ErrorHandler& operator=(ErrorHandler&&) = delete;

  mutable std::mutex mutex_;
  std::vector<ErrorCallback> callbacks_;
  std::atomic<ErrorLevel> min_level_{ErrorLevel::INFO};
  std::atomic<bool> enabled_{true};

  mutable std::mutex stats_mutex_;
  ErrorStats stats_;
  std::vector<ErrorInfo> recent_errors_;
  std::unordered_map<std::string, std::vector<ErrorInfo>> errors_by_component_;

  static constexpr size_t MAX_RECENT_ERRORS = 1000;
  static constexpr size_t MAX_COMPONENT_ERRORS = 100;

  void update_stats(const ErrorInfo& error);
  void notify_callbacks(const std::vector<ErrorCallback>& callbacks, const ErrorInfo& error);
  void add_to_recent_errors(const ErrorInfo& error);
  void add_to_component_errors(const ErrorInfo& error);
};

/**
 * @brief Convenience functions for common error reporting scenarios
 */
namespace error_reporting {

/**
 * @brief Report a release hook that failed where no caller can observe it
 * @param component Component name (e.g., "disposable", "async_disposable")
 * @param operation Operation that failed (e.g., "scope_exit", "async_dispose")
 * @param message Failure description
 */
COREKIT_API void report_release_failure(const std::string& component, const std::string& operation,
                                        const std::string& message);

/**
 * @brief Report a synchronization failure (aborted or failed semaphore wait)
 * @param component Component name
 * @param operation Operation that failed (e.g., "async_acquire")
 * @param ec Boost error code
 */
COREKIT_API void report_synchronization_error(const std::string& component, const std::string& operation,
                                              const boost::system::error_code& ec);

/**
 * @brief Report configuration error
 * @param component Component name
 * @param operation Operation that failed (e.g., "load", "apply")
 * @param message Error message
 */
COREKIT_API void report_configuration_error(const std::string& component, const std::string& operation,
                                            const std::string& message);

COREKIT_API void report_warning(const std::string& component, const std::string& operation, const std::string& message);

COREKIT_API void report_info(const std::string& component, const std::string& operation, const std::string& message);

}  // namespace error_reporting

}  // namespace diagnostics
}  // namespace corekit
