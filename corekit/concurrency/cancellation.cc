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

#include "corekit/concurrency/cancellation.hpp"

#include "corekit/diagnostics/exceptions.hpp"
#include "corekit/diagnostics/logger.hpp"

namespace corekit {
namespace concurrency {
namespace detail {

void CancellationState::cancel() {
  if (cancelled_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }

  std::vector<std::function<void()>> callbacks;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks.swap(callbacks_);
    callback_ids_.clear();
  }

  COREKIT_LOG_DEBUG("cancellation", "cancel",
                    "Cancellation requested, firing " + std::to_string(callbacks.size()) + " callback(s)");
  for (auto& callback : callbacks) {
    callback();
  }
}

CancellationState::CallbackId CancellationState::register_callback(std::function<void()> callback) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!cancelled_.load(std::memory_order_acquire)) {
      CallbackId id = next_id_++;
      callbacks_.push_back(std::move(callback));
      callback_ids_.push_back(id);
      return id;
    }
  }
  // Already cancelled; run outside the lock so the callback may re-enter
  callback();
  return 0;
}

void CancellationState::unregister_callback(CallbackId id) {
  if (id == 0) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  for (std::size_t i = 0; i < callback_ids_.size(); ++i) {
    if (callback_ids_[i] == id) {
      callbacks_.erase(callbacks_.begin() + static_cast<std::ptrdiff_t>(i));
      callback_ids_.erase(callback_ids_.begin() + static_cast<std::ptrdiff_t>(i));
      return;
    }
  }
}

}  // namespace detail

void CancellationToken::throw_if_cancelled(const std::string& operation) const {
  if (is_cancelled()) {
    throw diagnostics::OperationCancelledException(operation);
  }
}

CancellationToken::CallbackId CancellationToken::register_callback(std::function<void()> callback) const {
  if (!state_) {
    return 0;
  }
  return state_->register_callback(std::move(callback));
}

void CancellationToken::unregister_callback(CallbackId id) const {
  if (state_) {
    state_->unregister_callback(id);
  }
}

}  // namespace concurrency
}  // namespace corekit
