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

#include <boost/asio/associated_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/asio/bind_executor.hpp>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <optional>
#include <utility>

#include "corekit/base/visibility.hpp"
#include "corekit/concurrency/cancellation.hpp"
#include "corekit/concurrency/counting_semaphore.hpp"
#include "corekit/lifecycle/async_disposable.hpp"
#include "corekit/lifecycle/disposable.hpp"

namespace corekit {
namespace concurrency {

/**
 * @brief Release hook resource that returns one slot to a semaphore
 *
 * Does not own the semaphore. A default-constructed slot holds nothing and
 * releases nothing.
 */
class COREKIT_API SemaphoreSlot {
 public:
  SemaphoreSlot() = default;
  explicit SemaphoreSlot(CountingSemaphore& semaphore) : semaphore_(&semaphore) {}

  void release_managed();

  CountingSemaphore* semaphore() const noexcept { return semaphore_; }

 private:
  CountingSemaphore* semaphore_ = nullptr;
};

using SemaphoreReleaser = lifecycle::Disposable<SemaphoreSlot>;
using AsyncSemaphoreReleaser = lifecycle::AsyncDisposable<SemaphoreSlot>;

/**
 * @brief Block until a slot is available and return a handle that gives it back
 */
COREKIT_API SemaphoreReleaser acquire_and_release(CountingSemaphore& semaphore);

/**
 * @return Empty when the timeout elapsed first; nothing is acquired in that case
 */
template <typename Rep, typename Period>
std::optional<SemaphoreReleaser> try_acquire_and_release_for(CountingSemaphore& semaphore,
                                                             const std::chrono::duration<Rep, Period>& timeout) {
  if (!semaphore.try_acquire_for(timeout)) {
    return std::nullopt;
  }
  return std::optional<SemaphoreReleaser>(std::in_place, SemaphoreSlot(semaphore));
}

template <typename Clock, typename Duration>
std::optional<SemaphoreReleaser> try_acquire_and_release_until(
    CountingSemaphore& semaphore, const std::chrono::time_point<Clock, Duration>& deadline) {
  if (!semaphore.try_acquire_until(deadline)) {
    return std::nullopt;
  }
  return std::optional<SemaphoreReleaser>(std::in_place, SemaphoreSlot(semaphore));
}

namespace detail {

/**
 * @brief Adapt a void(error_code, AsyncSemaphoreReleaser) handler to a
 *        semaphore wait completion, keeping the handler's executor
 */
template <typename Handler>
auto make_releaser_completion(CountingSemaphore& semaphore, Handler handler) {
  auto ex = boost::asio::get_associated_executor(handler, semaphore.get_executor());
  CountingSemaphore::executor_type handle_executor = semaphore.get_executor();
  CountingSemaphore* target = &semaphore;
  return boost::asio::bind_executor(
      ex, [handler = std::move(handler), handle_executor, target](const boost::system::error_code& ec) mutable {
        if (ec) {
          handler(ec, AsyncSemaphoreReleaser::make_disposed(handle_executor, SemaphoreSlot{}));
          return;
        }
        handler(ec, AsyncSemaphoreReleaser(handle_executor, SemaphoreSlot(*target)));
      });
}

}  // namespace detail

/**
 * @brief Asynchronously acquire a slot
 *
 * Signature: void(boost::system::error_code, AsyncSemaphoreReleaser). On
 * timeout (boost::asio::error::timed_out) or cancellation
 * (boost::asio::error::operation_aborted) the handle is already disposed and
 * the semaphore is untouched.
 */
template <typename CompletionToken>
auto async_acquire_and_release(CountingSemaphore& semaphore, CancellationToken cancel, CompletionToken&& token) {
  return boost::asio::async_initiate<CompletionToken, void(boost::system::error_code, AsyncSemaphoreReleaser)>(
      [&semaphore](auto handler, CancellationToken cancel) {
        semaphore.async_acquire(std::move(cancel), detail::make_releaser_completion(semaphore, std::move(handler)));
      },
      token, std::move(cancel));
}

template <typename CompletionToken>
auto async_acquire_and_release(CountingSemaphore& semaphore, CompletionToken&& token) {
  return async_acquire_and_release(semaphore, CancellationToken{}, std::forward<CompletionToken>(token));
}

template <typename CompletionToken>
auto async_acquire_and_release_until(CountingSemaphore& semaphore, CountingSemaphore::clock_type::time_point deadline,
                                     CancellationToken cancel, CompletionToken&& token) {
  return boost::asio::async_initiate<CompletionToken, void(boost::system::error_code, AsyncSemaphoreReleaser)>(
      [&semaphore](auto handler, CountingSemaphore::clock_type::time_point deadline, CancellationToken cancel) {
        semaphore.async_acquire_until(deadline, std::move(cancel),
                                      detail::make_releaser_completion(semaphore, std::move(handler)));
      },
      token, deadline, std::move(cancel));
}

template <typename CompletionToken>
auto async_acquire_and_release_until(CountingSemaphore& semaphore, CountingSemaphore::clock_type::time_point deadline,
                                     CompletionToken&& token) {
  return async_acquire_and_release_until(semaphore, deadline, CancellationToken{},
                                         std::forward<CompletionToken>(token));
}

template <typename Rep, typename Period, typename CompletionToken>
auto async_acquire_and_release_for(CountingSemaphore& semaphore, const std::chrono::duration<Rep, Period>& timeout,
                                   CancellationToken cancel, CompletionToken&& token) {
  return async_acquire_and_release_until(semaphore, CountingSemaphore::deadline_after(timeout), std::move(cancel),
                                         std::forward<CompletionToken>(token));
}

template <typename Rep, typename Period, typename CompletionToken>
auto async_acquire_and_release_for(CountingSemaphore& semaphore, const std::chrono::duration<Rep, Period>& timeout,
                                   CompletionToken&& token) {
  return async_acquire_and_release_for(semaphore, timeout, CancellationToken{},
                                       std::forward<CompletionToken>(token));
}

}  // namespace concurrency
}  // namespace corekit
