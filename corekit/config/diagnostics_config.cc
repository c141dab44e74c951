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

#include "corekit/config/diagnostics_config.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>

#include "corekit/diagnostics/error_handler.hpp"
#include "corekit/diagnostics/exceptions.hpp"

namespace corekit {
namespace config {

namespace {

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return std::tolower(c); });
  return value;
}

bool get_or(const YAML::Node& n, const char* key, bool defv) {
  if (n[key]) return n[key].as<bool>();
  return defv;
}

std::string get_or(const YAML::Node& n, const char* key, const std::string& defv) {
  if (n[key]) return n[key].as<std::string>();
  return defv;
}

}  // namespace

diagnostics::LogLevel parse_log_level(const std::string& name) {
  std::string lower = to_lower(name);
  if (lower == "debug") return diagnostics::LogLevel::DEBUG;
  if (lower == "info") return diagnostics::LogLevel::INFO;
  if (lower == "warning" || lower == "warn") return diagnostics::LogLevel::WARNING;
  if (lower == "error") return diagnostics::LogLevel::ERROR;
  if (lower == "critical") return diagnostics::LogLevel::CRITICAL;
  throw diagnostics::ConfigurationException("Unknown log level: " + name, "logging", "parse");
}

diagnostics::ErrorLevel parse_error_level(const std::string& name) {
  std::string lower = to_lower(name);
  if (lower == "info") return diagnostics::ErrorLevel::INFO;
  if (lower == "warning" || lower == "warn") return diagnostics::ErrorLevel::WARNING;
  if (lower == "error") return diagnostics::ErrorLevel::ERROR;
  if (lower == "critical") return diagnostics::ErrorLevel::CRITICAL;
  throw diagnostics::ConfigurationException("Unknown error level: " + name, "error_reporting", "parse");
}

void DiagnosticsConfig::apply() const {
  if (!is_valid()) {
    diagnostics::error_reporting::report_configuration_error("config", "apply",
                                                             "log_format must contain {message}");
    throw diagnostics::ConfigurationException("Invalid diagnostics configuration: log_format must contain {message}",
                                              "logging", "apply");
  }

  auto& logger = diagnostics::Logger::instance();
  logger.set_level(log_level);
  logger.set_console_output(console_output);
  logger.set_file_output(log_file);
  logger.set_format(log_format);

  auto& handler = diagnostics::ErrorHandler::instance();
  handler.set_enabled(error_reporting_enabled);
  handler.set_min_error_level(min_error_level);

  COREKIT_LOG_DEBUG("config", "apply", "Diagnostics configuration applied");
}

DiagnosticsConfig load_diagnostics_config_from_yaml(const std::string& path) {
  DiagnosticsConfig c;
  try {
    YAML::Node root = YAML::LoadFile(path);

    if (YAML::Node logging = root["logging"]) {
      if (logging["level"]) c.log_level = parse_log_level(logging["level"].as<std::string>());
      c.console_output = get_or(logging, "console", c.console_output);
      c.log_file = get_or(logging, "file", c.log_file);
      c.log_format = get_or(logging, "format", c.log_format);
    }

    if (YAML::Node reporting = root["error_reporting"]) {
      c.error_reporting_enabled = get_or(reporting, "enabled", c.error_reporting_enabled);
      if (reporting["min_level"]) c.min_error_level = parse_error_level(reporting["min_level"].as<std::string>());
    }
  } catch (const diagnostics::ConfigurationException& e) {
    diagnostics::error_reporting::report_configuration_error("config", "load", e.get_full_message());
    throw;
  } catch (const YAML::Exception& e) {
    diagnostics::error_reporting::report_configuration_error("config", "load", path + ": " + e.what());
    throw diagnostics::ConfigurationException("Failed to load " + path + ": " + e.what(), "", "load");
  }

  if (!c.is_valid()) {
    diagnostics::error_reporting::report_configuration_error("config", "load", "log_format must contain {message}");
    throw diagnostics::ConfigurationException("Invalid diagnostics configuration in " + path, "logging", "load");
  }
  return c;
}

}  // namespace config
}  // namespace corekit
