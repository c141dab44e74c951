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

#include "corekit/concurrency/counting_semaphore.hpp"

#include <algorithm>
#include <boost/asio/error.hpp>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <utility>
#include <vector>

#include "corekit/diagnostics/error_handler.hpp"
#include "corekit/diagnostics/exceptions.hpp"
#include "corekit/diagnostics/logger.hpp"
#include "corekit/util/ensure.hpp"

namespace corekit {
namespace concurrency {

namespace detail {

GrantedSlot& GrantedSlot::operator=(GrantedSlot&& other) noexcept {
  if (this != &other) {
    give_back();
    give_back_ = std::exchange(other.give_back_, nullptr);
  }
  return *this;
}

GrantedSlot::~GrantedSlot() { give_back(); }

void GrantedSlot::give_back() noexcept {
  auto fn = std::exchange(give_back_, nullptr);
  if (!fn) {
    return;
  }
  try {
    fn();
  } catch (const diagnostics::SemaphoreFullException& e) {
    // Released past max_count by someone else while the slot was in flight
    COREKIT_LOG_ERROR("semaphore", "give_back", std::string("Failed to return undelivered slot: ") + e.what());
    diagnostics::error_reporting::report_synchronization_error(
        "semaphore", "give_back", boost::system::errc::make_error_code(boost::system::errc::value_too_large));
  } catch (const std::exception& e) {
    COREKIT_LOG_ERROR("semaphore", "give_back", std::string("Failed to return undelivered slot: ") + e.what());
    diagnostics::error_reporting::report_synchronization_error(
        "semaphore", "give_back", boost::system::errc::make_error_code(boost::system::errc::io_error));
  }
}

bool SemaphoreWaitOp::complete(const boost::system::error_code& ec, GrantedSlot slot) {
  CancellationToken token;
  CancellationToken::CallbackId callback_id = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (done_) {
      return false;
    }
    done_ = true;
    if (timer_) {
      timer_->cancel();
    }
    token = std::move(token_);
    callback_id = callback_id_;
  }

  token.unregister_callback(callback_id);
  do_complete(ec, std::move(slot));
  return true;
}

void SemaphoreWaitOp::attach_cancellation(CancellationToken token, CancellationToken::CallbackId id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!done_) {
      token_ = std::move(token);
      callback_id_ = id;
      return;
    }
  }
  token.unregister_callback(id);
}

}  // namespace detail

struct CountingSemaphore::Impl : std::enable_shared_from_this<CountingSemaphore::Impl> {
  using WaitOpPtr = std::shared_ptr<detail::SemaphoreWaitOp>;

  Impl(executor_type ex, std::ptrdiff_t initial, std::ptrdiff_t max)
      : executor(std::move(ex)), count(initial), max_count(max) {}

  executor_type executor;
  mutable std::mutex mutex;
  std::condition_variable available_cv;
  std::ptrdiff_t count;
  const std::ptrdiff_t max_count;
  std::deque<WaitOpPtr> waiters;
  std::size_t blocked_threads = 0;

  // Removes a still-queued waiter and completes it with ec. A waiter that was
  // already granted a slot is left alone.
  void abandon(const WaitOpPtr& op, const boost::system::error_code& ec) {
    {
      std::lock_guard<std::mutex> lock(mutex);
      auto it = std::find(waiters.begin(), waiters.end(), op);
      if (it == waiters.end()) {
        return;
      }
      waiters.erase(it);
    }

    COREKIT_LOG_DEBUG("semaphore", "async_acquire", "Async wait abandoned: " + ec.message());
    op->complete(ec);
  }

  // Ownership of one slot already subtracted from count. Undelivered slots come
  // back through release() and may be granted to the next waiter.
  detail::GrantedSlot grant_slot() {
    std::weak_ptr<Impl> weak_self = weak_from_this();
    return detail::GrantedSlot([weak_self] {
      if (auto self = weak_self.lock()) {
        COREKIT_LOG_WARNING("semaphore", "give_back", "Async completion destroyed before running, slot returned");
        self->release(1);
      }
    });
  }

  void release(std::ptrdiff_t release_count) {
    std::vector<WaitOpPtr> granted;
    {
      std::lock_guard<std::mutex> lock(mutex);
      if (max_count - count < release_count) {
        throw diagnostics::SemaphoreFullException(max_count, release_count);
      }
      count += release_count;

      while (count > 0 && !waiters.empty()) {
        granted.push_back(std::move(waiters.front()));
        waiters.pop_front();
        --count;
      }

      if (count > 0 && blocked_threads > 0) {
        available_cv.notify_all();
      }
    }

    for (auto& op : granted) {
      op->complete(boost::system::error_code{}, grant_slot());
    }
  }

  std::vector<WaitOpPtr> drain_waiters() {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<WaitOpPtr> drained(waiters.begin(), waiters.end());
    waiters.clear();
    return drained;
  }
};

namespace {

void validate_counts(std::ptrdiff_t initial_count, std::ptrdiff_t max_count) {
  util::ensure::not_out_of_range(max_count, "max_count", std::ptrdiff_t{1});
  util::ensure::not_out_of_range(initial_count, "initial_count", std::ptrdiff_t{0}, max_count);
}

}  // namespace

CountingSemaphore::CountingSemaphore(executor_type ex, std::ptrdiff_t initial_count, std::ptrdiff_t max_count) {
  validate_counts(initial_count, max_count);
  impl_ = std::make_shared<Impl>(std::move(ex), initial_count, max_count);
}

CountingSemaphore::CountingSemaphore(boost::asio::io_context& ioc, std::ptrdiff_t initial_count,
                                     std::ptrdiff_t max_count)
    : CountingSemaphore(executor_type(ioc.get_executor()), initial_count, max_count) {}

CountingSemaphore::~CountingSemaphore() {
  auto pending = impl_->drain_waiters();
  if (!pending.empty()) {
    COREKIT_LOG_WARNING("semaphore", "destroy",
                        "Destroyed with " + std::to_string(pending.size()) + " pending async wait(s)");
  }
  for (auto& op : pending) {
    op->complete(boost::asio::error::operation_aborted);
  }
}

CountingSemaphore::executor_type CountingSemaphore::get_executor() const noexcept { return impl_->executor; }

void CountingSemaphore::acquire() {
  std::unique_lock<std::mutex> lock(impl_->mutex);
  ++impl_->blocked_threads;
  impl_->available_cv.wait(lock, [this] { return impl_->count > 0; });
  --impl_->blocked_threads;
  --impl_->count;
}

bool CountingSemaphore::try_acquire() {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  if (impl_->count > 0) {
    --impl_->count;
    return true;
  }
  return false;
}

bool CountingSemaphore::try_acquire_until_steady(clock_type::time_point deadline) {
  std::unique_lock<std::mutex> lock(impl_->mutex);
  ++impl_->blocked_threads;
  bool acquired = true;
  if (deadline == clock_type::time_point::max()) {
    impl_->available_cv.wait(lock, [this] { return impl_->count > 0; });
  } else {
    acquired = impl_->available_cv.wait_until(lock, deadline, [this] { return impl_->count > 0; });
  }
  --impl_->blocked_threads;
  if (acquired) {
    --impl_->count;
  }
  return acquired;
}

void CountingSemaphore::start_async_wait(std::shared_ptr<detail::SemaphoreWaitOp> op,
                                         std::optional<clock_type::time_point> deadline, CancellationToken cancel) {
  if (cancel.is_cancelled()) {
    op->complete(boost::asio::error::operation_aborted);
    return;
  }

  bool acquired = false;
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->waiters.empty() && impl_->count > 0) {
      --impl_->count;
      acquired = true;
    } else {
      impl_->waiters.push_back(op);
    }
  }

  if (acquired) {
    op->complete(boost::system::error_code{}, impl_->grant_slot());
    return;
  }

  std::weak_ptr<Impl> weak_impl = impl_;
  std::weak_ptr<detail::SemaphoreWaitOp> weak_op = op;

  if (deadline && *deadline != clock_type::time_point::max()) {
    op->arm_timer(impl_->executor, *deadline, [weak_impl, weak_op](const boost::system::error_code& ec) {
      if (ec == boost::asio::error::operation_aborted) {
        return;
      }
      auto impl = weak_impl.lock();
      auto pending = weak_op.lock();
      if (impl && pending) {
        impl->abandon(pending, boost::asio::error::timed_out);
      }
    });
  }

  if (cancel.can_be_cancelled()) {
    auto id = cancel.register_callback([weak_impl, weak_op] {
      auto impl = weak_impl.lock();
      auto pending = weak_op.lock();
      if (impl && pending) {
        impl->abandon(pending, boost::asio::error::operation_aborted);
      }
    });
    op->attach_cancellation(std::move(cancel), id);
  }
}

void CountingSemaphore::release(std::ptrdiff_t count) {
  util::ensure::not_out_of_range(count, "release_count", std::ptrdiff_t{1});
  impl_->release(count);
}

std::ptrdiff_t CountingSemaphore::available() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->count;
}

std::ptrdiff_t CountingSemaphore::max_count() const noexcept { return impl_->max_count; }

std::size_t CountingSemaphore::waiting() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->waiters.size() + impl_->blocked_threads;
}

void CountingSemaphore::cancel() {
  auto pending = impl_->drain_waiters();
  for (auto& op : pending) {
    op->complete(boost::asio::error::operation_aborted);
  }
  if (!pending.empty()) {
    diagnostics::error_reporting::report_synchronization_error("semaphore", "cancel",
                                                               boost::asio::error::operation_aborted);
  }
}

}  // namespace concurrency
}  // namespace corekit
