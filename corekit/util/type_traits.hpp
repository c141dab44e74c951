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

#include <type_traits>

namespace corekit {
namespace util {

/**
 * @brief True for types that can be instantiated directly (not abstract)
 */
template <typename T>
struct is_concrete : std::bool_constant<!std::is_abstract<T>::value> {};

template <typename T>
inline constexpr bool is_concrete_v = is_concrete<T>::value;

/**
 * @brief True when T is Template<Args...> for some Args
 */
template <typename T, template <typename...> class Template>
struct is_specialization_of : std::false_type {};

template <template <typename...> class Template, typename... Args>
struct is_specialization_of<Template<Args...>, Template> : std::true_type {};

template <typename T, template <typename...> class Template>
inline constexpr bool is_specialization_of_v = is_specialization_of<T, Template>::value;

namespace detail {

template <template <typename...> class Template, typename... Args>
std::true_type derives_from_template_test(const volatile Template<Args...>*);

template <template <typename...> class Template>
std::false_type derives_from_template_test(...);

}  // namespace detail

/**
 * @brief True when T is, or publicly and unambiguously derives from, a
 *        specialization of Template
 */
template <typename T, template <typename...> class Template>
struct derives_from_template
    : decltype(detail::derives_from_template_test<Template>(std::declval<std::remove_reference_t<T>*>())) {};

template <typename T, template <typename...> class Template>
inline constexpr bool derives_from_template_v = derives_from_template<T, Template>::value;

}  // namespace util
}  // namespace corekit
