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

#include "corekit/util/ensure.hpp"

#include <cctype>

namespace corekit {
namespace util {
namespace ensure {

namespace {

constexpr const char* kEmptyString = "Value cannot be an empty string.";
constexpr const char* kWhiteSpace = "Value cannot be composed entirely of whitespace.";
constexpr const char* kNilUuid = "Value cannot be an all-zero UUID.";

}  // namespace

namespace detail {

std::string out_of_range_message(const std::optional<std::string>& lower, const std::optional<std::string>& upper) {
  if (lower && upper) {
    return "Value must be between " + *lower + " and " + *upper + ", inclusive.";
  }
  if (lower) {
    return "Value must be greater than or equal to " + *lower + ".";
  }
  if (upper) {
    return "Value must be less than or equal to " + *upper + ".";
  }
  return "Value is out of range.";
}

bool is_white_space(std::string_view value) noexcept {
  return std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

}  // namespace detail

const std::string& not_null_or_empty(const std::string& value, const std::string& param_name) {
  if (value.empty()) {
    throw diagnostics::EmptyArgumentException(kEmptyString, param_name);
  }
  return value;
}

std::string_view not_null_or_empty(std::string_view value, const std::string& param_name) {
  if (value.data() == nullptr) {
    throw diagnostics::NullArgumentException(param_name);
  }
  if (value.empty()) {
    throw diagnostics::EmptyArgumentException(kEmptyString, param_name);
  }
  return value;
}

const char* not_null_or_empty(const char* value, const std::string& param_name) {
  not_null(value, param_name);
  if (*value == '\0') {
    throw diagnostics::EmptyArgumentException(kEmptyString, param_name);
  }
  return value;
}

const std::string& not_null_or_empty(const std::optional<std::string>& value, const std::string& param_name) {
  return not_null_or_empty(not_null(value, param_name), param_name);
}

const boost::uuids::uuid& not_null_or_empty(const boost::uuids::uuid& value, const std::string& param_name) {
  if (value.is_nil()) {
    throw diagnostics::EmptyArgumentException(kNilUuid, param_name);
  }
  return value;
}

const boost::uuids::uuid& not_null_or_empty(const std::optional<boost::uuids::uuid>& value,
                                            const std::string& param_name) {
  return not_null_or_empty(not_null(value, param_name), param_name);
}

const std::string& not_null_or_white_space(const std::string& value, const std::string& param_name) {
  not_null_or_empty(value, param_name);
  if (detail::is_white_space(value)) {
    throw diagnostics::EmptyArgumentException(kWhiteSpace, param_name);
  }
  return value;
}

std::string_view not_null_or_white_space(std::string_view value, const std::string& param_name) {
  not_null_or_empty(value, param_name);
  if (detail::is_white_space(value)) {
    throw diagnostics::EmptyArgumentException(kWhiteSpace, param_name);
  }
  return value;
}

const char* not_null_or_white_space(const char* value, const std::string& param_name) {
  not_null_or_empty(value, param_name);
  if (detail::is_white_space(value)) {
    throw diagnostics::EmptyArgumentException(kWhiteSpace, param_name);
  }
  return value;
}

const std::string& not_null_or_white_space(const std::optional<std::string>& value, const std::string& param_name) {
  return not_null_or_white_space(not_null(value, param_name), param_name);
}

}  // namespace ensure
}  // namespace util
}  // namespace corekit
