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

#include <atomic>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/associated_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/asio/execution/outstanding_work.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/prefer.hpp>
#include <boost/system/error_code.hpp>
#include <exception>
#include <memory>
#include <type_traits>
#include <typeinfo>
#include <utility>

#include "corekit/lifecycle/detail/hook_traits.hpp"
#include "corekit/lifecycle/detail/release_reporting.hpp"
#include "corekit/lifecycle/disposable.hpp"
#include "corekit/lifecycle/disposal_state.hpp"

namespace corekit {
namespace lifecycle {

namespace detail {

// Completion side of one async_dispose() call
template <typename Handler, typename Executor>
class AsyncDisposeOp {
  using handler_executor_type = boost::asio::associated_executor_t<Handler, Executor>;
  using work_executor_type = typename std::decay<decltype(boost::asio::prefer(
      std::declval<handler_executor_type>(), boost::asio::execution::outstanding_work.tracked))>::type;

 public:
  AsyncDisposeOp(Handler handler, const Executor& ex)
      : handler_(std::move(handler)),
        work_(boost::asio::prefer(boost::asio::get_associated_executor(handler_, ex),
                                  boost::asio::execution::outstanding_work.tracked)) {}

  // First caller wins; the async hook may misbehave and call back twice
  bool claim_finish() noexcept { return !finishing_.exchange(true, std::memory_order_acq_rel); }

  void complete(const boost::system::error_code& ec) {
    boost::asio::post(work_, [handler = std::move(handler_), ec]() mutable { handler(ec); });
  }

 private:
  Handler handler_;
  work_executor_type work_;
  std::atomic<bool> finishing_{false};
};

}  // namespace detail

/**
 * @brief Disposable with an asynchronous managed release phase
 *
 * In addition to the hooks understood by Disposable, Resource may provide
 *
 * @code
 * template <typename Handler>
 * void async_release_managed(Handler&& handler);  // calls handler(error_code) once
 * @endcode
 *
 * async_dispose() runs the async hook (or release_managed() when there is
 * none), then release_unmanaged(), and only then commits the Disposed state.
 * Whichever of dispose() and async_dispose() wins the transition runs the
 * hooks; the other is a no-op. The wrapped state is shared with in-flight
 * operations, so the handle may be moved or destroyed while async_dispose()
 * is pending.
 */
template <typename Resource>
class AsyncDisposable {
  static_assert(!std::is_reference<Resource>::value, "AsyncDisposable holds its resource by value");

  struct State {
    template <typename... Args>
    explicit State(Args&&... args) : resource(std::forward<Args>(args)...) {}

    Resource resource;
    DisposalGate gate;
  };

 public:
  using resource_type = Resource;
  using executor_type = boost::asio::any_io_executor;

  static constexpr const char* component = "async_disposable";

  AsyncDisposable(executor_type ex, Resource resource)
      : executor_(std::move(ex)), state_(std::make_shared<State>(std::move(resource))) {}

  template <typename... Args>
  AsyncDisposable(executor_type ex, std::in_place_t, Args&&... args)
      : executor_(std::move(ex)), state_(std::make_shared<State>(std::forward<Args>(args)...)) {}

  static AsyncDisposable make_disposed(executor_type ex, Resource resource) {
    AsyncDisposable handle(std::move(ex), std::move(resource));
    handle.state_->gate.adopt(DisposalState::Disposed);
    return handle;
  }

  AsyncDisposable(const AsyncDisposable&) = delete;
  AsyncDisposable& operator=(const AsyncDisposable&) = delete;

  AsyncDisposable(AsyncDisposable&& other) noexcept : executor_(other.executor_), state_(std::move(other.state_)) {}

  AsyncDisposable& operator=(AsyncDisposable&& other) {
    if (this != &other) {
      dispose_at_scope_exit("assign");
      executor_ = other.executor_;
      state_ = std::move(other.state_);
    }
    return *this;
  }

  ~AsyncDisposable() { dispose_at_scope_exit("scope_exit"); }

  executor_type get_executor() const noexcept { return executor_; }

  /**
   * @brief Asynchronously dispose the resource
   *
   * Signature: void(boost::system::error_code). Completes without running any
   * hook when the handle is already disposed or disposing. An error from the
   * async hook is forwarded; a throwing hook is reported and completes with
   * errc::io_error. The state is committed in every case.
   */
  template <typename CompletionToken>
  auto async_dispose(CompletionToken&& token) {
    return boost::asio::async_initiate<CompletionToken, void(boost::system::error_code)>(
        [](auto handler, std::shared_ptr<State> state, executor_type ex) {
          start_async_dispose(std::move(state), std::move(handler), ex);
        },
        token, state_, executor_);
  }

  /**
   * @brief Synchronous disposal
   *
   * Runs release_managed() if present, then release_unmanaged(). A resource
   * whose managed release is async-only gets only its unmanaged hook, with a
   * warning logged.
   */
  void dispose() {
    if (!state_ || !state_->gate.try_begin()) {
      return;
    }
    if constexpr (detail::has_async_release_managed<Resource>::value &&
                  !detail::has_release_managed<Resource>::value) {
      detail::warn_async_only_hook(component, typeid(Resource));
    }
    std::exception_ptr failure = detail::run_release_hooks(state_->resource, true, component);
    state_->gate.commit();
    detail::log_disposal(component, "dispose", typeid(Resource));
    if (failure) {
      std::rethrow_exception(failure);
    }
  }

  void release_unmanaged_only() {
    if (!state_ || !state_->gate.try_begin()) {
      return;
    }
    std::exception_ptr failure = detail::run_release_hooks(state_->resource, false, component);
    state_->gate.commit();
    if (failure) {
      detail::report_hook_failure(component, "release_unmanaged_only", failure);
    }
  }

  /**
   * @brief True once disposal completed, and for moved-from handles
   */
  bool is_disposed() const noexcept { return !state_ || state_->gate.is_disposed(); }

  DisposalState state() const noexcept { return state_ ? state_->gate.state() : DisposalState::Disposed; }

  // Accessors require a handle that has not been moved from
  Resource& get() noexcept { return state_->resource; }
  const Resource& get() const noexcept { return state_->resource; }

  Resource* operator->() noexcept { return &state_->resource; }
  const Resource* operator->() const noexcept { return &state_->resource; }

  Resource& operator*() noexcept { return state_->resource; }
  const Resource& operator*() const noexcept { return state_->resource; }

 private:
  template <typename Handler>
  static void start_async_dispose(std::shared_ptr<State> state, Handler handler, const executor_type& ex) {
    using op_type = detail::AsyncDisposeOp<Handler, executor_type>;
    auto op = std::make_shared<op_type>(std::move(handler), ex);

    if (!state || !state->gate.try_begin()) {
      op->complete(boost::system::error_code{});
      return;
    }

    if constexpr (detail::has_async_release_managed<Resource>::value) {
      try {
        state->resource.async_release_managed(
            [state, op](const boost::system::error_code& ec) { finish_async_dispose(state, op, ec); });
      } catch (...) {
        detail::report_hook_failure(component, "async_dispose", std::current_exception());
        finish_async_dispose(state, op, boost::system::errc::make_error_code(boost::system::errc::io_error));
      }
    } else if constexpr (detail::has_release_managed<Resource>::value) {
      boost::system::error_code ec;
      try {
        state->resource.release_managed();
      } catch (...) {
        detail::report_hook_failure(component, "async_dispose", std::current_exception());
        ec = boost::system::errc::make_error_code(boost::system::errc::io_error);
      }
      finish_async_dispose(state, op, ec);
    } else {
      finish_async_dispose(state, op, boost::system::error_code{});
    }
  }

  template <typename Op>
  static void finish_async_dispose(const std::shared_ptr<State>& state, const std::shared_ptr<Op>& op,
                                   boost::system::error_code ec) {
    if (!op->claim_finish()) {
      return;
    }

    if constexpr (detail::has_release_unmanaged<Resource>::value) {
      try {
        state->resource.release_unmanaged();
      } catch (...) {
        detail::report_hook_failure(component, "async_dispose", std::current_exception());
        if (!ec) {
          ec = boost::system::errc::make_error_code(boost::system::errc::io_error);
        }
      }
    }

    state->gate.commit();

    if (ec) {
      detail::report_release_error(component, "async_dispose", ec);
    } else {
      detail::log_disposal(component, "async_dispose", typeid(Resource));
    }
    op->complete(ec);
  }

  void dispose_at_scope_exit(const char* operation) noexcept {
    if (!state_ || state_->gate.state() != DisposalState::Live) {
      return;
    }
    try {
      dispose();
    } catch (...) {
      detail::report_hook_failure(component, operation, std::current_exception());
    }
  }

  executor_type executor_;
  std::shared_ptr<State> state_;
};

template <typename Resource, typename... Args>
AsyncDisposable<Resource> make_async_disposable(boost::asio::any_io_executor ex, Args&&... args) {
  return AsyncDisposable<Resource>(std::move(ex), std::in_place, std::forward<Args>(args)...);
}

}  // namespace lifecycle
}  // namespace corekit
