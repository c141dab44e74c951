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
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <mutex>
#include <vector>

#include "corekit/base/visibility.hpp"

namespace corekit {
namespace concurrency {

class CancellationSource;

namespace detail {

/**
 * @brief Shared state behind one CancellationSource and all of its tokens
 */
class COREKIT_API CancellationState {
 public:
  using CallbackId = std::size_t;

  bool is_cancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

  /**
   * @brief Set the cancelled flag and fire every registered callback once
   */
  void cancel();

  /**
   * @brief Register a callback invoked on cancellation
   * @return Id for unregister_callback(); 0 when the state was already
   *         cancelled, in which case the callback has run before returning
   */
  CallbackId register_callback(std::function<void()> callback);

  void unregister_callback(CallbackId id);

 private:
  std::atomic<bool> cancelled_{false};
  std::mutex mutex_;
  std::vector<std::function<void()>> callbacks_;
  std::vector<CallbackId> callback_ids_;
  CallbackId next_id_{1};
};

}  // namespace detail

/**
 * @brief Copyable observer of a CancellationSource
 *
 * A default-constructed token is never cancelled.
 */
class COREKIT_API CancellationToken {
 public:
  using CallbackId = detail::CancellationState::CallbackId;

  CancellationToken() = default;

  bool is_cancelled() const noexcept { return state_ && state_->is_cancelled(); }

  /**
   * @brief True when the token is attached to a source
   */
  bool can_be_cancelled() const noexcept { return state_ != nullptr; }

  /**
   * @throws diagnostics::OperationCancelledException when cancelled
   */
  void throw_if_cancelled(const std::string& operation = "") const;

  CallbackId register_callback(std::function<void()> callback) const;
  void unregister_callback(CallbackId id) const;

  explicit operator bool() const noexcept { return can_be_cancelled(); }

 private:
  friend class CancellationSource;
  explicit CancellationToken(std::shared_ptr<detail::CancellationState> state) : state_(std::move(state)) {}

  std::shared_ptr<detail::CancellationState> state_;
};

/**
 * @brief Owns cancellation state and hands out tokens
 */
class COREKIT_API CancellationSource {
 public:
  CancellationSource() : state_(std::make_shared<detail::CancellationState>()) {}

  CancellationToken token() const { return CancellationToken{state_}; }

  void cancel() { state_->cancel(); }

  bool is_cancelled() const noexcept { return state_->is_cancelled(); }

 private:
  std::shared_ptr<detail::CancellationState> state_;
};

}  // namespace concurrency
}  // namespace corekit
