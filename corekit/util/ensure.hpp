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

#include <algorithm>
#include <boost/uuid/uuid.hpp>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "corekit/base/visibility.hpp"
#include "corekit/diagnostics/exceptions.hpp"

namespace corekit {
namespace util {

/**
 * @brief Declares the valid members of an enumeration for ensure::not_invalid_enum
 *
 * Specialize for each enum that is validated:
 * @code
 * template <>
 * struct enum_traits<Color> {
 *   static constexpr const char* name = "Color";
 *   static constexpr std::array<Color, 3> values{Color::Red, Color::Green, Color::Blue};
 * };
 * @endcode
 */
template <typename Enum>
struct enum_traits;

namespace ensure {

namespace detail {

template <typename T>
struct identity {
  using type = T;
};

template <typename T>
using identity_t = typename identity<T>::type;

template <typename T, typename = void>
struct is_streamable : std::false_type {};

template <typename T>
struct is_streamable<T, std::void_t<decltype(std::declval<std::ostream&>() << std::declval<const T&>())>>
    : std::true_type {};

template <typename T, typename = void>
struct is_sized_range : std::false_type {};

template <typename T>
struct is_sized_range<T, std::void_t<decltype(std::begin(std::declval<const T&>())),
                                     decltype(std::end(std::declval<const T&>()))>> : std::true_type {};

template <typename T>
std::string describe(const T& value) {
  if constexpr (is_streamable<T>::value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
  } else {
    return "?";
  }
}

COREKIT_API std::string out_of_range_message(const std::optional<std::string>& lower,
                                             const std::optional<std::string>& upper);

COREKIT_API bool is_white_space(std::string_view value) noexcept;

}  // namespace detail

/**
 * @brief Values of non-nullable types are returned unchanged, as a copy so
 *        that temporaries can be bound safely
 */
template <typename T>
T not_null(const T& value, const std::string& /*param_name*/) {
  return value;
}

/**
 * @throws diagnostics::NullArgumentException when value is nullptr
 */
template <typename T>
T* not_null(T* value, const std::string& param_name) {
  if (value == nullptr) {
    throw diagnostics::NullArgumentException(param_name);
  }
  return value;
}

[[noreturn]] inline std::nullptr_t not_null(std::nullptr_t, const std::string& param_name) {
  throw diagnostics::NullArgumentException(param_name);
}

template <typename T>
const std::shared_ptr<T>& not_null(const std::shared_ptr<T>& value, const std::string& param_name) {
  if (!value) {
    throw diagnostics::NullArgumentException(param_name);
  }
  return value;
}

template <typename T, typename Deleter>
const std::unique_ptr<T, Deleter>& not_null(const std::unique_ptr<T, Deleter>& value, const std::string& param_name) {
  if (!value) {
    throw diagnostics::NullArgumentException(param_name);
  }
  return value;
}

/**
 * @return The contained value
 */
template <typename T>
const T& not_null(const std::optional<T>& value, const std::string& param_name) {
  if (!value.has_value()) {
    throw diagnostics::NullArgumentException(param_name);
  }
  return *value;
}

template <typename T>
T not_null(std::optional<T>&& value, const std::string& param_name) {
  if (!value.has_value()) {
    throw diagnostics::NullArgumentException(param_name);
  }
  return std::move(*value);
}

COREKIT_API const std::string& not_null_or_empty(const std::string& value, const std::string& param_name);
COREKIT_API std::string_view not_null_or_empty(std::string_view value, const std::string& param_name);
COREKIT_API const char* not_null_or_empty(const char* value, const std::string& param_name);
COREKIT_API const std::string& not_null_or_empty(const std::optional<std::string>& value,
                                                 const std::string& param_name);

/**
 * @throws diagnostics::EmptyArgumentException for the nil (all-zero) UUID
 */
COREKIT_API const boost::uuids::uuid& not_null_or_empty(const boost::uuids::uuid& value,
                                                        const std::string& param_name);
COREKIT_API const boost::uuids::uuid& not_null_or_empty(const std::optional<boost::uuids::uuid>& value,
                                                        const std::string& param_name);

/**
 * @brief Collections must contain at least one element
 */
template <typename Container, typename = std::enable_if_t<detail::is_sized_range<Container>::value>>
const Container& not_null_or_empty(const Container& value, const std::string& param_name) {
  if (std::begin(value) == std::end(value)) {
    throw diagnostics::EmptyArgumentException("Collection must contain at least one element.", param_name);
  }
  return value;
}

template <typename Container, typename = std::enable_if_t<detail::is_sized_range<Container>::value>>
const Container& not_null_or_empty(const Container* value, const std::string& param_name) {
  return not_null_or_empty(*not_null(value, param_name), param_name);
}

COREKIT_API const std::string& not_null_or_white_space(const std::string& value, const std::string& param_name);
COREKIT_API std::string_view not_null_or_white_space(std::string_view value, const std::string& param_name);
COREKIT_API const char* not_null_or_white_space(const char* value, const std::string& param_name);
COREKIT_API const std::string& not_null_or_white_space(const std::optional<std::string>& value,
                                                       const std::string& param_name);

/**
 * @brief Check a comparable value against optional inclusive bounds
 * @param lower Inclusive lower bound, std::nullopt for none
 * @param upper Inclusive upper bound, std::nullopt for none
 * @throws diagnostics::ArgumentOutOfRangeException naming the violated bound(s)
 */
template <typename T>
const T& not_out_of_range(const T& value, const std::string& param_name,
                          const std::optional<detail::identity_t<T>>& lower = std::nullopt,
                          const std::optional<detail::identity_t<T>>& upper = std::nullopt) {
  bool below = lower.has_value() && value < *lower;
  bool above = upper.has_value() && *upper < value;
  if (below || above) {
    std::optional<std::string> lower_text;
    std::optional<std::string> upper_text;
    if (lower) {
      lower_text = detail::describe(*lower);
    }
    if (upper) {
      upper_text = detail::describe(*upper);
    }
    throw diagnostics::ArgumentOutOfRangeException(detail::out_of_range_message(lower_text, upper_text), param_name,
                                                   detail::describe(value));
  }
  return value;
}

/**
 * @brief Check that value is one of the members listed by enum_traits<Enum>
 * @throws diagnostics::InvalidEnumArgumentException otherwise
 */
template <typename Enum>
Enum not_invalid_enum(Enum value, const std::string& param_name) {
  static_assert(std::is_enum<Enum>::value, "not_invalid_enum requires an enumeration type");
  using traits = enum_traits<Enum>;
  const auto& values = traits::values;
  if (std::find(std::begin(values), std::end(values), value) == std::end(values)) {
    throw diagnostics::InvalidEnumArgumentException(
        param_name, static_cast<int64_t>(static_cast<std::underlying_type_t<Enum>>(value)), traits::name);
  }
  return value;
}

}  // namespace ensure
}  // namespace util
}  // namespace corekit
