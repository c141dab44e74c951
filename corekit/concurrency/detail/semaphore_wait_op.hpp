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
#include <boost/asio/execution/outstanding_work.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/prefer.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/system/error_code.hpp>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <type_traits>
#include <utility>

#include "corekit/base/visibility.hpp"
#include "corekit/concurrency/cancellation.hpp"

namespace corekit {
namespace concurrency {
namespace detail {

/**
 * @brief Ownership of a slot granted to an async waiter whose handler has not
 *        run yet
 *
 * Travels with the posted completion. The slot goes back to the semaphore when
 * the completion is destroyed without being invoked, e.g. because the handler's
 * execution context was shut down.
 */
class COREKIT_API GrantedSlot {
 public:
  GrantedSlot() = default;
  explicit GrantedSlot(std::function<void()> give_back) : give_back_(std::move(give_back)) {}

  GrantedSlot(GrantedSlot&& other) noexcept : give_back_(std::exchange(other.give_back_, nullptr)) {}
  GrantedSlot& operator=(GrantedSlot&& other) noexcept;

  GrantedSlot(const GrantedSlot&) = delete;
  GrantedSlot& operator=(const GrantedSlot&) = delete;

  ~GrantedSlot();

  /**
   * @brief The handler is about to run and takes over the slot
   */
  void disarm() noexcept { give_back_ = nullptr; }

  bool armed() const noexcept { return static_cast<bool>(give_back_); }

 private:
  void give_back() noexcept;

  std::function<void()> give_back_;
};

/**
 * @brief Type-erased pending async acquisition
 *
 * Owned by the semaphore's waiter queue while pending. complete() delivers the
 * result at most once and tears down the deadline timer and the cancellation
 * registration.
 */
class COREKIT_API SemaphoreWaitOp {
 public:
  virtual ~SemaphoreWaitOp() = default;

  /**
   * @brief Deliver the outcome to the handler
   * @param slot The slot taken for a successful wait, handed to the completion
   * @return false if the operation had already completed
   */
  bool complete(const boost::system::error_code& ec, GrantedSlot slot = GrantedSlot{});

  /**
   * @brief Start the deadline timer unless the operation already completed
   */
  template <typename TimerHandler>
  void arm_timer(const boost::asio::any_io_executor& ex, boost::asio::steady_timer::time_point deadline,
                 TimerHandler&& on_expiry) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (done_) {
      return;
    }
    timer_.emplace(ex, deadline);
    timer_->async_wait(std::forward<TimerHandler>(on_expiry));
  }

  void attach_cancellation(CancellationToken token, CancellationToken::CallbackId id);

 protected:
  SemaphoreWaitOp() = default;

  virtual void do_complete(const boost::system::error_code& ec, GrantedSlot slot) = 0;

 private:
  std::mutex mutex_;
  bool done_ = false;
  std::optional<boost::asio::steady_timer> timer_;
  CancellationToken token_;
  CancellationToken::CallbackId callback_id_ = 0;
};

template <typename Handler, typename Executor>
class SemaphoreWaitOpImpl final : public SemaphoreWaitOp {
  using handler_executor_type = boost::asio::associated_executor_t<Handler, Executor>;
  using work_executor_type = typename std::decay<decltype(boost::asio::prefer(
      std::declval<handler_executor_type>(), boost::asio::execution::outstanding_work.tracked))>::type;

 public:
  SemaphoreWaitOpImpl(Handler handler, const Executor& ex)
      : handler_(std::move(handler)),
        work_(boost::asio::prefer(boost::asio::get_associated_executor(handler_, ex),
                                  boost::asio::execution::outstanding_work.tracked)) {}

 private:
  void do_complete(const boost::system::error_code& ec, GrantedSlot slot) override {
    boost::asio::post(work_, [handler = std::move(handler_), ec, slot = std::move(slot)]() mutable {
      slot.disarm();
      handler(ec);
    });
  }

  Handler handler_;
  work_executor_type work_;
};

template <typename Handler, typename Executor>
std::shared_ptr<SemaphoreWaitOp> make_wait_op(Handler&& handler, const Executor& ex) {
  using op_type = SemaphoreWaitOpImpl<typename std::decay<Handler>::type, Executor>;
  return std::make_shared<op_type>(std::forward<Handler>(handler), ex);
}

}  // namespace detail
}  // namespace concurrency
}  // namespace corekit
