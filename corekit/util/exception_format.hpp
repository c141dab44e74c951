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

#include <exception>
#include <string>

#include "corekit/base/visibility.hpp"

namespace corekit {
namespace util {

/**
 * @brief Human readable name of the dynamic type of an exception
 */
COREKIT_API std::string exception_type_name(const std::exception& e);

/**
 * @brief Build "<type>: <what>" for e
 *
 * With include_nested, every exception attached through std::throw_with_nested
 * is appended as " [NestedException (depth): <type>: <what>]", outermost first.
 */
COREKIT_API std::string detail_message(const std::exception& e, bool include_nested = true);

/**
 * @brief detail_message() for a captured exception
 * @return Empty string for a null exception_ptr
 */
COREKIT_API std::string detail_message(const std::exception_ptr& eptr, bool include_nested = true);

}  // namespace util
}  // namespace corekit
