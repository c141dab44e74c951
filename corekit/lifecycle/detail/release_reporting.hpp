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

#include <boost/system/error_code.hpp>
#include <exception>
#include <typeinfo>

#include "corekit/base/visibility.hpp"

namespace corekit {
namespace lifecycle {
namespace detail {

/**
 * @brief Log and report a release hook failure that no caller will observe
 */
COREKIT_API void report_hook_failure(const char* component, const char* operation, const std::exception_ptr& failure);

/**
 * @brief Log a secondary hook failure dropped in favor of the first one
 */
COREKIT_API void report_suppressed_failure(const char* component, const std::exception_ptr& failure);

/**
 * @brief Report an error code delivered by an async release hook
 */
COREKIT_API void report_release_error(const char* component, const char* operation,
                                      const boost::system::error_code& ec);

COREKIT_API void log_disposal(const char* component, const char* operation, const std::type_info& resource_type);

COREKIT_API void warn_async_only_hook(const char* component, const std::type_info& resource_type);

}  // namespace detail
}  // namespace lifecycle
}  // namespace corekit
