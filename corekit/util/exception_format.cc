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

#include "corekit/util/exception_format.hpp"

#include <boost/core/demangle.hpp>
#include <typeinfo>

namespace corekit {
namespace util {

namespace {

std::string describe(const std::exception& e) { return exception_type_name(e) + ": " + e.what(); }

void append_nested(const std::exception& e, std::string& out, int depth) {
  try {
    std::rethrow_if_nested(e);
  } catch (const std::exception& nested) {
    ++depth;
    out += " [NestedException (" + std::to_string(depth) + "): " + describe(nested) + "]";
    append_nested(nested, out, depth);
  } catch (...) {
    ++depth;
    out += " [NestedException (" + std::to_string(depth) + "): non-standard exception]";
  }
}

}  // namespace

std::string exception_type_name(const std::exception& e) { return boost::core::demangle(typeid(e).name()); }

std::string detail_message(const std::exception& e, bool include_nested) {
  std::string message = describe(e);
  if (include_nested) {
    append_nested(e, message, 0);
  }
  return message;
}

std::string detail_message(const std::exception_ptr& eptr, bool include_nested) {
  if (!eptr) {
    return {};
  }
  try {
    std::rethrow_exception(eptr);
  } catch (const std::exception& e) {
    return detail_message(e, include_nested);
  } catch (...) {
    return "non-standard exception";
  }
}

}  // namespace util
}  // namespace corekit
