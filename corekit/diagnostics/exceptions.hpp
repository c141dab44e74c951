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

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace corekit {
namespace diagnostics {

/**
 * @brief Base exception class for all corekit exceptions
 *
 * Carries the component and operation that raised the error so reports can be
 * correlated with log output.
 */
class CorekitException : public std::runtime_error {
 public:
  explicit CorekitException(const std::string& message, const std::string& component = "",
                            const std::string& operation = "")
      : std::runtime_error(message), component_(component), operation_(operation) {}

  const std::string& get_component() const noexcept { return component_; }
  const std::string& get_operation() const noexcept { return operation_; }

  std::string get_full_message() const {
    std::string full_msg = what();
    if (!component_.empty()) {
      full_msg = "[" + component_ + "] " + full_msg;
    }
    if (!operation_.empty()) {
      full_msg += " (operation: " + operation_ + ")";
    }
    return full_msg;
  }

 private:
  std::string component_;
  std::string operation_;
};

/**
 * @brief Base class for argument validation failures
 *
 * Every guard clause in corekit::util::ensure throws a subclass of this type.
 */
class ArgumentException : public CorekitException {
 public:
  explicit ArgumentException(const std::string& message, const std::string& parameter = "")
      : CorekitException(message, "validation", "validate"), parameter_(parameter) {}

  const std::string& get_parameter() const noexcept { return parameter_; }

  std::string get_full_message() const {
    std::string full_msg = CorekitException::get_full_message();
    if (!parameter_.empty()) {
      full_msg += " (parameter: " + parameter_ + ")";
    }
    return full_msg;
  }

 private:
  std::string parameter_;
};

/**
 * @brief A required argument was absent
 */
class NullArgumentException : public ArgumentException {
 public:
  explicit NullArgumentException(const std::string& parameter)
      : ArgumentException("Value cannot be null.", parameter) {}
};

/**
 * @brief A string, identifier or collection argument was present but had no content
 */
class EmptyArgumentException : public ArgumentException {
 public:
  EmptyArgumentException(const std::string& reason, const std::string& parameter)
      : ArgumentException(reason, parameter), reason_(reason) {}

  const std::string& get_reason() const noexcept { return reason_; }

 private:
  std::string reason_;
};

/**
 * @brief A comparable value fell outside an inclusive lower/upper bound
 */
class ArgumentOutOfRangeException : public ArgumentException {
 public:
  ArgumentOutOfRangeException(const std::string& message, const std::string& parameter,
                              const std::string& actual_value)
      : ArgumentException(message, parameter), actual_value_(actual_value) {}

  const std::string& get_actual_value() const noexcept { return actual_value_; }

  std::string get_full_message() const {
    std::string full_msg = ArgumentException::get_full_message();
    if (!actual_value_.empty()) {
      full_msg += " (actual: " + actual_value_ + ")";
    }
    return full_msg;
  }

 private:
  std::string actual_value_;
};

/**
 * @brief A value was not among the declared members of its enumeration
 */
class InvalidEnumArgumentException : public ArgumentException {
 public:
  InvalidEnumArgumentException(const std::string& parameter, int64_t invalid_value, const std::string& enum_type)
      : ArgumentException("The value of argument '" + parameter + "' (" + std::to_string(invalid_value) +
                              ") is invalid for Enum type '" + enum_type + "'.",
                          parameter),
        invalid_value_(invalid_value),
        enum_type_(enum_type) {}

  int64_t get_invalid_value() const noexcept { return invalid_value_; }
  const std::string& get_enum_type() const noexcept { return enum_type_; }

 private:
  int64_t invalid_value_;
  std::string enum_type_;
};

/**
 * @brief Releasing would push a semaphore above its maximum count
 */
class SemaphoreFullException : public CorekitException {
 public:
  SemaphoreFullException(std::ptrdiff_t max_count, std::ptrdiff_t release_count)
      : CorekitException("Adding the specified count to the semaphore would cause it to exceed its maximum count.",
                         "semaphore", "release"),
        max_count_(max_count),
        release_count_(release_count) {}

  std::ptrdiff_t get_max_count() const noexcept { return max_count_; }
  std::ptrdiff_t get_release_count() const noexcept { return release_count_; }

 private:
  std::ptrdiff_t max_count_;
  std::ptrdiff_t release_count_;
};

/**
 * @brief Thrown by CancellationToken::throw_if_cancelled()
 */
class OperationCancelledException : public CorekitException {
 public:
  explicit OperationCancelledException(const std::string& operation = "")
      : CorekitException("The operation was cancelled.", "cancellation", operation) {}
};

/**
 * @brief Exception thrown during configuration operations
 *
 * Indicates errors that occur during configuration loading,
 * validation, or application.
 */
class ConfigurationException : public CorekitException {
 public:
  explicit ConfigurationException(const std::string& message, const std::string& config_section = "",
                                  const std::string& operation = "")
      : CorekitException(message, "configuration", operation), config_section_(config_section) {}

  const std::string& get_config_section() const noexcept { return config_section_; }

  std::string get_full_message() const {
    std::string full_msg = CorekitException::get_full_message();
    if (!config_section_.empty()) {
      full_msg += " (section: " + config_section_ + ")";
    }
    return full_msg;
  }

 private:
  std::string config_section_;
};

}  // namespace diagnostics
}  // namespace corekit
