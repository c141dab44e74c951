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

#include <string>

#include "corekit/base/visibility.hpp"
#include "corekit/diagnostics/error_types.hpp"
#include "corekit/diagnostics/logger.hpp"

namespace corekit {
namespace config {

/**
 * @brief Logger and ErrorHandler settings
 *
 * YAML layout accepted by load_diagnostics_config_from_yaml():
 * @code
 * logging:
 *   level: debug          # debug, info, warning, error, critical
 *   console: true
 *   file: /var/log/app.log
 *   format: "{timestamp} [{level}] {message}"
 * error_reporting:
 *   enabled: true
 *   min_level: warning    # info, warning, error, critical
 * @endcode
 */
struct DiagnosticsConfig {
  diagnostics::LogLevel log_level = diagnostics::LogLevel::INFO;
  bool console_output = true;
  std::string log_file;  // empty disables file output
  std::string log_format = "{timestamp} [{level}] [{component}] [{operation}] {message}";

  bool error_reporting_enabled = true;
  diagnostics::ErrorLevel min_error_level = diagnostics::ErrorLevel::INFO;

  bool is_valid() const { return !log_format.empty() && log_format.find("{message}") != std::string::npos; }

  /**
   * @brief Push the settings into Logger::instance() and ErrorHandler::instance()
   * @throws diagnostics::ConfigurationException if !is_valid()
   */
  COREKIT_API void apply() const;
};

/**
 * @throws diagnostics::ConfigurationException for unknown names
 */
COREKIT_API diagnostics::LogLevel parse_log_level(const std::string& name);
COREKIT_API diagnostics::ErrorLevel parse_error_level(const std::string& name);

/**
 * @brief Load diagnostics settings; missing keys keep their defaults
 * @throws diagnostics::ConfigurationException when the file cannot be read or
 *         holds invalid values
 */
COREKIT_API DiagnosticsConfig load_diagnostics_config_from_yaml(const std::string& path);

}  // namespace config
}  // namespace corekit
