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
#include <cstdint>

namespace corekit {
namespace lifecycle {

/**
 * @brief Disposal state of a lifecycle wrapper
 */
enum class DisposalState : uint8_t {
  Live = 0,       // hooks not yet run
  Disposing = 1,  // one caller won the transition and is running hooks
  Disposed = 2    // terminal
};

/**
 * @brief One-shot Live -> Disposing -> Disposed transition
 *
 * try_begin() succeeds for exactly one caller over the lifetime of the gate.
 */
class DisposalGate {
 public:
  DisposalGate() = default;
  explicit DisposalGate(DisposalState initial) : state_(initial) {}

  DisposalGate(const DisposalGate&) = delete;
  DisposalGate& operator=(const DisposalGate&) = delete;

  bool try_begin() noexcept {
    DisposalState expected = DisposalState::Live;
    return state_.compare_exchange_strong(expected, DisposalState::Disposing, std::memory_order_acq_rel,
                                          std::memory_order_acquire);
  }

  void commit() noexcept { state_.store(DisposalState::Disposed, std::memory_order_release); }

  /**
   * @brief Hand the current state to a new owner, leaving this gate Disposed
   *
   * An in-flight Disposing state is not transferable and is reported as Disposed.
   */
  DisposalState surrender() noexcept {
    DisposalState previous = state_.exchange(DisposalState::Disposed, std::memory_order_acq_rel);
    return previous == DisposalState::Live ? DisposalState::Live : DisposalState::Disposed;
  }

  /**
   * @brief Take over a state produced by surrender() on another gate
   */
  void adopt(DisposalState state) noexcept { state_.store(state, std::memory_order_release); }

  DisposalState state() const noexcept { return state_.load(std::memory_order_acquire); }

  bool is_disposed() const noexcept { return state() == DisposalState::Disposed; }

 private:
  std::atomic<DisposalState> state_{DisposalState::Live};
};

inline const char* to_string(DisposalState state) {
  switch (state) {
    case DisposalState::Live:
      return "Live";
    case DisposalState::Disposing:
      return "Disposing";
    case DisposalState::Disposed:
      return "Disposed";
  }
  return "Unknown";
}

}  // namespace lifecycle
}  // namespace corekit
