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

#include <boost/asio/error.hpp>
#include <boost/system/error_code.hpp>

#include "corekit/base/error_codes.hpp"
#include "corekit/diagnostics/error_types.hpp"

namespace corekit {
namespace diagnostics {

/**
 * @brief Maps boost::system::error_code to corekit ErrorCode
 */
inline ErrorCode to_corekit_error_code(const boost::system::error_code& ec) {
  if (!ec) {
    return ErrorCode::Success;
  }

  if (ec == boost::asio::error::timed_out) {
    return ErrorCode::TimedOut;
  }
  if (ec == boost::asio::error::operation_aborted) {
    return ErrorCode::Cancelled;
  }
  if (ec == boost::system::errc::value_too_large) {
    return ErrorCode::SemaphoreFull;
  }
  if (ec == boost::system::errc::io_error) {
    return ErrorCode::ReleaseFailed;
  }
  if (ec == boost::system::errc::invalid_argument) {
    return ErrorCode::InvalidArgument;
  }

  return ErrorCode::InternalError;
}

/**
 * @brief True when an async wait ended because its deadline passed
 */
inline bool is_timeout(const boost::system::error_code& ec) { return ec == boost::asio::error::timed_out; }

/**
 * @brief True when an async wait ended through cancellation or shutdown
 */
inline bool is_cancellation(const boost::system::error_code& ec) {
  return ec == boost::asio::error::operation_aborted;
}

/**
 * @brief Derives an ErrorCode from a reported ErrorInfo
 */
inline ErrorCode to_error_code(const ErrorInfo& info) {
  if (info.boost_error) {
    return to_corekit_error_code(info.boost_error);
  }

  switch (info.category) {
    case ErrorCategory::VALIDATION:
      return ErrorCode::InvalidArgument;
    case ErrorCategory::LIFECYCLE:
      return ErrorCode::ReleaseFailed;
    case ErrorCategory::SYNCHRONIZATION:
      // Timeouts and cancellations always carry a boost error
      return ErrorCode::SemaphoreFull;
    case ErrorCategory::CONFIGURATION:
      return ErrorCode::InvalidConfiguration;
    case ErrorCategory::SYSTEM:
      return ErrorCode::InternalError;
    default:
      return ErrorCode::Unknown;
  }
}

}  // namespace diagnostics
}  // namespace corekit
