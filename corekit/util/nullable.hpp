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

#include <functional>
#include <optional>
#include <type_traits>
#include <utility>

namespace corekit {
namespace util {

/**
 * @brief True when value is empty or holds a value-initialized T
 */
template <typename T>
bool is_null_or_default(const std::optional<T>& value) {
  return !value.has_value() || *value == T{};
}

namespace detail {

template <typename Target, typename Func>
using if_not_null_invoke_t = std::invoke_result_t<Func, decltype(*std::declval<Target>())>;

template <typename Target, typename Func>
using if_not_null_result_t =
    std::conditional_t<std::is_void<if_not_null_invoke_t<Target, Func>>::value, void,
                       std::decay_t<if_not_null_invoke_t<Target, Func>>>;

}  // namespace detail

/**
 * @brief Invoke func with the pointee of target when target is engaged
 *
 * Works with raw and smart pointers and std::optional. When target is empty a
 * value-initialized result is returned, or nothing for void callables.
 */
template <typename Target, typename Func>
detail::if_not_null_result_t<Target&&, Func&&> if_not_null(Target&& target, Func&& func) {
  using result_type = detail::if_not_null_result_t<Target&&, Func&&>;
  if constexpr (std::is_void<result_type>::value) {
    if (target) {
      std::invoke(std::forward<Func>(func), *target);
    }
  } else {
    if (target) {
      return std::invoke(std::forward<Func>(func), *target);
    }
    return result_type{};
  }
}

}  // namespace util
}  // namespace corekit
