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

#include <exception>
#include <type_traits>
#include <typeinfo>
#include <utility>

#include "corekit/lifecycle/detail/hook_traits.hpp"
#include "corekit/lifecycle/detail/release_reporting.hpp"
#include "corekit/lifecycle/disposal_state.hpp"

namespace corekit {
namespace lifecycle {

namespace detail {

/**
 * @brief Run the synchronous hooks of resource in order managed, unmanaged
 *
 * The unmanaged hook runs even when the managed hook throws.
 * @return The first failure, if any
 */
template <typename Resource>
std::exception_ptr run_release_hooks(Resource& resource, bool run_managed, const char* component) {
  std::exception_ptr failure;
  if constexpr (has_release_managed<Resource>::value) {
    if (run_managed) {
      try {
        resource.release_managed();
      } catch (...) {
        failure = std::current_exception();
      }
    }
  }
  if constexpr (has_release_unmanaged<Resource>::value) {
    try {
      resource.release_unmanaged();
    } catch (...) {
      if (failure) {
        report_suppressed_failure(component, std::current_exception());
      } else {
        failure = std::current_exception();
      }
    }
  }
  return failure;
}

}  // namespace detail

/**
 * @brief Guarded two-phase release over a resource
 *
 * Resource may provide any of:
 *  - void release_managed()    cleanup that may touch other owned objects
 *  - void release_unmanaged()  cleanup that must always run
 *
 * Each hook runs at most once per Disposable. Disposal happens on the first of
 * dispose(), release_unmanaged_only() or destruction. Concurrent callers race
 * on a compare-and-swap; losers return immediately.
 */
template <typename Resource>
class Disposable {
  static_assert(!std::is_reference<Resource>::value, "Disposable holds its resource by value");

 public:
  using resource_type = Resource;

  static constexpr const char* component = "disposable";

  explicit Disposable(Resource resource) : resource_(std::move(resource)) {}

  template <typename... Args>
  explicit Disposable(std::in_place_t, Args&&... args) : resource_(std::forward<Args>(args)...) {}

  /**
   * @brief Wrap resource in a handle that is already disposed; no hook will run
   */
  static Disposable make_disposed(Resource resource) {
    Disposable handle(std::move(resource));
    handle.gate_.adopt(DisposalState::Disposed);
    return handle;
  }

  Disposable(const Disposable&) = delete;
  Disposable& operator=(const Disposable&) = delete;

  /**
   * @brief Transfer the resource; the source becomes disposed without running hooks
   */
  Disposable(Disposable&& other) noexcept(std::is_nothrow_move_constructible<Resource>::value)
      : resource_(std::move(other.resource_)), gate_(other.gate_.surrender()) {}

  Disposable& operator=(Disposable&& other) {
    if (this != &other) {
      dispose_at_scope_exit("assign");
      resource_ = std::move(other.resource_);
      gate_.adopt(other.gate_.surrender());
    }
    return *this;
  }

  ~Disposable() { dispose_at_scope_exit("scope_exit"); }

  /**
   * @brief Run release_managed() then release_unmanaged(), once
   *
   * The state is committed even if a hook throws; the first exception is
   * rethrown to the caller.
   */
  void dispose() {
    if (!gate_.try_begin()) {
      return;
    }
    std::exception_ptr failure = detail::run_release_hooks(resource_, true, component);
    gate_.commit();
    detail::log_disposal(component, "dispose", typeid(Resource));
    if (failure) {
      std::rethrow_exception(failure);
    }
  }

  /**
   * @brief Teardown path that skips release_managed()
   *
   * For owners tearing down an object graph whose managed targets may already
   * be gone. Failures are reported, not thrown.
   */
  void release_unmanaged_only() {
    if (!gate_.try_begin()) {
      return;
    }
    std::exception_ptr failure = detail::run_release_hooks(resource_, false, component);
    gate_.commit();
    if (failure) {
      detail::report_hook_failure(component, "release_unmanaged_only", failure);
    }
  }

  bool is_disposed() const noexcept { return gate_.is_disposed(); }

  DisposalState state() const noexcept { return gate_.state(); }

  Resource& get() noexcept { return resource_; }
  const Resource& get() const noexcept { return resource_; }

  Resource* operator->() noexcept { return &resource_; }
  const Resource* operator->() const noexcept { return &resource_; }

  Resource& operator*() noexcept { return resource_; }
  const Resource& operator*() const noexcept { return resource_; }

 private:
  void dispose_at_scope_exit(const char* operation) noexcept {
    if (gate_.state() != DisposalState::Live) {
      return;
    }
    try {
      dispose();
    } catch (...) {
      detail::report_hook_failure(component, operation, std::current_exception());
    }
  }

  Resource resource_;
  DisposalGate gate_;
};

template <typename Resource, typename... Args>
Disposable<Resource> make_disposable(Args&&... args) {
  return Disposable<Resource>(std::in_place, std::forward<Args>(args)...);
}

}  // namespace lifecycle
}  // namespace corekit
