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
#include <type_traits>
#include <utility>

namespace corekit {
namespace lifecycle {
namespace detail {

// Stand-in completion handler used only to probe for async_release_managed
struct release_handler_probe {
  void operator()(const boost::system::error_code&) const {}
};

template <typename T, typename = void>
struct has_release_managed : std::false_type {};

template <typename T>
struct has_release_managed<T, std::void_t<decltype(std::declval<T&>().release_managed())>> : std::true_type {};

template <typename T, typename = void>
struct has_release_unmanaged : std::false_type {};

template <typename T>
struct has_release_unmanaged<T, std::void_t<decltype(std::declval<T&>().release_unmanaged())>> : std::true_type {};

template <typename T, typename = void>
struct has_async_release_managed : std::false_type {};

template <typename T>
struct has_async_release_managed<
    T, std::void_t<decltype(std::declval<T&>().async_release_managed(std::declval<release_handler_probe>()))>>
    : std::true_type {};

}  // namespace detail
}  // namespace lifecycle
}  // namespace corekit
