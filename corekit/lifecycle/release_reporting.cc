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

#include "corekit/lifecycle/detail/release_reporting.hpp"

#include <boost/core/demangle.hpp>

#include "corekit/diagnostics/error_handler.hpp"
#include "corekit/diagnostics/logger.hpp"
#include "corekit/util/exception_format.hpp"

namespace corekit {
namespace lifecycle {
namespace detail {

void report_hook_failure(const char* component, const char* operation, const std::exception_ptr& failure) {
  std::string message = "Release hook failed: " + util::detail_message(failure);
  COREKIT_LOG_ERROR(component, operation, message);
  diagnostics::error_reporting::report_release_failure(component, operation, message);
}

void report_suppressed_failure(const char* component, const std::exception_ptr& failure) {
  COREKIT_LOG_WARNING(component, "dispose",
                      "Suppressed secondary release failure: " + util::detail_message(failure));
}

void report_release_error(const char* component, const char* operation, const boost::system::error_code& ec) {
  COREKIT_LOG_ERROR(component, operation, "Async release hook failed: " + ec.message());
  diagnostics::ErrorHandler::instance().report_error(diagnostics::ErrorInfo(
      diagnostics::ErrorLevel::ERROR, diagnostics::ErrorCategory::LIFECYCLE, component, operation, ec.message(), ec));
}

void log_disposal(const char* component, const char* operation, const std::type_info& resource_type) {
  COREKIT_LOG_DEBUG(component, operation, "Disposed " + boost::core::demangle(resource_type.name()));
}

void warn_async_only_hook(const char* component, const std::type_info& resource_type) {
  COREKIT_LOG_WARNING(component, "dispose",
                      boost::core::demangle(resource_type.name()) +
                          " only provides async_release_managed; use async_dispose() for managed release");
}

}  // namespace detail
}  // namespace lifecycle
}  // namespace corekit
