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

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <cstddef>
#include <limits>
#include <memory>
#include <optional>

#include "corekit/base/visibility.hpp"
#include "corekit/concurrency/cancellation.hpp"
#include "corekit/concurrency/detail/semaphore_wait_op.hpp"

namespace corekit {
namespace concurrency {

/**
 * @brief Counting semaphore with blocking, timed and asynchronous acquisition
 *
 * The semaphore is owned by the caller. Async waiters are served in FIFO order
 * and take precedence over threads blocked in acquire(). Async completions run
 * on the handler's associated executor, defaulting to the semaphore executor.
 *
 * Async outcomes:
 *  - success: empty error_code, one slot taken
 *  - boost::asio::error::timed_out: the deadline passed, nothing taken
 *  - boost::asio::error::operation_aborted: cancelled or the semaphore was
 *    destroyed, nothing taken
 */
class COREKIT_API CountingSemaphore {
 public:
  using executor_type = boost::asio::any_io_executor;
  using clock_type = std::chrono::steady_clock;

  static constexpr std::ptrdiff_t unbounded = std::numeric_limits<std::ptrdiff_t>::max();

  /**
   * @param initial_count Slots available on construction (0..max_count)
   * @param max_count Upper bound enforced by release()
   * @throws diagnostics::ArgumentOutOfRangeException on inconsistent counts
   */
  CountingSemaphore(executor_type ex, std::ptrdiff_t initial_count, std::ptrdiff_t max_count = unbounded);
  CountingSemaphore(boost::asio::io_context& ioc, std::ptrdiff_t initial_count,
                    std::ptrdiff_t max_count = unbounded);
  ~CountingSemaphore();

  CountingSemaphore(const CountingSemaphore&) = delete;
  CountingSemaphore& operator=(const CountingSemaphore&) = delete;

  executor_type get_executor() const noexcept;

  /**
   * @brief Block the calling thread until a slot is available
   */
  void acquire();

  bool try_acquire();

  template <typename Rep, typename Period>
  bool try_acquire_for(const std::chrono::duration<Rep, Period>& timeout) {
    return try_acquire_until_steady(deadline_after(timeout));
  }

  template <typename Clock, typename Duration>
  bool try_acquire_until(const std::chrono::time_point<Clock, Duration>& deadline) {
    if (deadline == std::chrono::time_point<Clock, Duration>::max()) {
      return try_acquire_until_steady(clock_type::time_point::max());
    }
    return try_acquire_until_steady(deadline_after(deadline - Clock::now()));
  }

  template <typename CompletionToken>
  auto async_acquire(CompletionToken&& token) {
    return async_acquire(CancellationToken{}, std::forward<CompletionToken>(token));
  }

  template <typename CompletionToken>
  auto async_acquire(CancellationToken cancel, CompletionToken&& token) {
    return initiate_wait(std::nullopt, std::move(cancel), std::forward<CompletionToken>(token));
  }

  template <typename Rep, typename Period, typename CompletionToken>
  auto async_acquire_for(const std::chrono::duration<Rep, Period>& timeout, CompletionToken&& token) {
    return async_acquire_for(timeout, CancellationToken{}, std::forward<CompletionToken>(token));
  }

  template <typename Rep, typename Period, typename CompletionToken>
  auto async_acquire_for(const std::chrono::duration<Rep, Period>& timeout, CancellationToken cancel,
                         CompletionToken&& token) {
    return initiate_wait(deadline_after(timeout), std::move(cancel), std::forward<CompletionToken>(token));
  }

  template <typename CompletionToken>
  auto async_acquire_until(clock_type::time_point deadline, CompletionToken&& token) {
    return async_acquire_until(deadline, CancellationToken{}, std::forward<CompletionToken>(token));
  }

  template <typename CompletionToken>
  auto async_acquire_until(clock_type::time_point deadline, CancellationToken cancel, CompletionToken&& token) {
    return initiate_wait(deadline, std::move(cancel), std::forward<CompletionToken>(token));
  }

  /**
   * @brief Return slots to the semaphore
   * @throws diagnostics::SemaphoreFullException if max_count would be exceeded
   * @throws diagnostics::ArgumentOutOfRangeException if count < 1
   */
  void release(std::ptrdiff_t count = 1);

  std::ptrdiff_t available() const;
  std::ptrdiff_t max_count() const noexcept;

  /**
   * @brief Number of pending async waits plus blocked threads
   */
  std::size_t waiting() const;

  /**
   * @brief Abort every pending async wait with operation_aborted
   */
  void cancel();

  /**
   * @brief now() + timeout rounded up, saturating at time_point::max()
   *
   * A deadline of time_point::max() never expires. Non-positive timeouts
   * yield now().
   */
  template <typename Rep, typename Period>
  static clock_type::time_point deadline_after(const std::chrono::duration<Rep, Period>& timeout) {
    const auto now = clock_type::now();
    if (timeout <= std::chrono::duration<Rep, Period>::zero()) {
      return now;
    }
    const auto remaining = clock_type::time_point::max() - now;
    if (std::chrono::duration<double>(timeout) >= std::chrono::duration<double>(remaining)) {
      return clock_type::time_point::max();
    }
    const auto step = std::chrono::ceil<clock_type::duration>(timeout);
    if (step >= remaining) {
      return clock_type::time_point::max();
    }
    return now + step;
  }

 private:
  template <typename CompletionToken>
  auto initiate_wait(std::optional<clock_type::time_point> deadline, CancellationToken cancel,
                     CompletionToken&& token) {
    return boost::asio::async_initiate<CompletionToken, void(boost::system::error_code)>(
        [this](auto handler, std::optional<clock_type::time_point> deadline, CancellationToken cancel) {
          start_async_wait(detail::make_wait_op(std::move(handler), get_executor()), deadline, std::move(cancel));
        },
        token, deadline, std::move(cancel));
  }

  void start_async_wait(std::shared_ptr<detail::SemaphoreWaitOp> op, std::optional<clock_type::time_point> deadline,
                        CancellationToken cancel);

  bool try_acquire_until_steady(clock_type::time_point deadline);

  struct Impl;
  std::shared_ptr<Impl> impl_;
};

}  // namespace concurrency
}  // namespace corekit
