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

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "corekit/lifecycle/disposable.hpp"
#include "test_utils.hpp"

using namespace corekit;
using namespace corekit::lifecycle;
using namespace corekit::test;

namespace {

struct HookCounters {
  std::atomic<int> managed{0};
  std::atomic<int> unmanaged{0};
  std::vector<std::string> order;
};

struct TrackedResource {
  std::shared_ptr<HookCounters> counters = std::make_shared<HookCounters>();
  bool throw_in_managed = false;
  bool throw_in_unmanaged = false;

  void release_managed() {
    ++counters->managed;
    counters->order.push_back("managed");
    if (throw_in_managed) {
      throw std::runtime_error("managed release failed");
    }
  }

  void release_unmanaged() {
    ++counters->unmanaged;
    counters->order.push_back("unmanaged");
    if (throw_in_unmanaged) {
      throw std::logic_error("unmanaged release failed");
    }
  }
};

struct UnmanagedOnly {
  std::shared_ptr<int> calls = std::make_shared<int>(0);
  void release_unmanaged() { ++*calls; }
};

class MockReleaseHooks {
 public:
  MOCK_METHOD(void, release_managed, ());
  MOCK_METHOD(void, release_unmanaged, ());
};

// Mocks are neither copyable nor movable, so the resource forwards to one
struct MockedResource {
  MockReleaseHooks* hooks;
  void release_managed() { hooks->release_managed(); }
  void release_unmanaged() { hooks->release_unmanaged(); }
};

struct NoHooks {
  int value = 7;
};

}  // namespace

class DisposableTest : public DiagnosticsTest {};

TEST_F(DisposableTest, FreshHandleIsNotDisposed) {
  Disposable<TrackedResource> handle{TrackedResource{}};

  EXPECT_FALSE(handle.is_disposed());
  EXPECT_EQ(handle.state(), DisposalState::Live);
}

TEST_F(DisposableTest, DisposeRunsManagedThenUnmanagedOnce) {
  // Given
  Disposable<TrackedResource> handle{TrackedResource{}};
  auto counters = handle->counters;

  // When: dispose several times
  for (int i = 0; i < 5; ++i) {
    handle.dispose();
  }

  // Then
  EXPECT_TRUE(handle.is_disposed());
  EXPECT_EQ(counters->managed.load(), 1);
  EXPECT_EQ(counters->unmanaged.load(), 1);
  ASSERT_EQ(counters->order.size(), 2u);
  EXPECT_EQ(counters->order[0], "managed");
  EXPECT_EQ(counters->order[1], "unmanaged");
}

TEST_F(DisposableTest, ScopeExitDisposes) {
  std::shared_ptr<HookCounters> counters;
  {
    Disposable<TrackedResource> handle{TrackedResource{}};
    counters = handle->counters;
  }

  EXPECT_EQ(counters->managed.load(), 1);
  EXPECT_EQ(counters->unmanaged.load(), 1);
}

TEST_F(DisposableTest, ScopeExitAfterExplicitDisposeDoesNothing) {
  std::shared_ptr<HookCounters> counters;
  {
    Disposable<TrackedResource> handle{TrackedResource{}};
    counters = handle->counters;
    handle.dispose();
  }

  EXPECT_EQ(counters->managed.load(), 1);
  EXPECT_EQ(counters->unmanaged.load(), 1);
}

TEST_F(DisposableTest, ReleaseUnmanagedOnlySkipsManagedHook) {
  Disposable<TrackedResource> handle{TrackedResource{}};
  auto counters = handle->counters;

  handle.release_unmanaged_only();
  handle.dispose();

  EXPECT_TRUE(handle.is_disposed());
  EXPECT_EQ(counters->managed.load(), 0);
  EXPECT_EQ(counters->unmanaged.load(), 1);
}

TEST_F(DisposableTest, ManagedFailurePropagatesAfterUnmanagedRuns) {
  // Given: a resource whose managed hook throws
  TrackedResource resource;
  resource.throw_in_managed = true;
  auto counters = resource.counters;
  Disposable<TrackedResource> handle{std::move(resource)};

  // When / Then
  EXPECT_THROW(handle.dispose(), std::runtime_error);
  EXPECT_TRUE(handle.is_disposed());
  EXPECT_EQ(counters->unmanaged.load(), 1);

  // A second call is still a no-op
  EXPECT_NO_THROW(handle.dispose());
  EXPECT_EQ(counters->managed.load(), 1);
}

TEST_F(DisposableTest, FirstFailureWinsWhenBothHooksThrow) {
  TrackedResource resource;
  resource.throw_in_managed = true;
  resource.throw_in_unmanaged = true;
  Disposable<TrackedResource> handle{std::move(resource)};

  EXPECT_THROW(handle.dispose(), std::runtime_error);
  EXPECT_TRUE(logged(diagnostics::LogLevel::WARNING, "unmanaged release failed"));
}

TEST_F(DisposableTest, ScopeExitFailureIsReportedNotThrown) {
  auto& handler = diagnostics::ErrorHandler::instance();

  {
    TrackedResource resource;
    resource.throw_in_managed = true;
    Disposable<TrackedResource> handle{std::move(resource)};
  }

  EXPECT_TRUE(handler.has_errors("disposable"));
  auto errors = handler.get_errors_by_component("disposable");
  ASSERT_FALSE(errors.empty());
  EXPECT_EQ(errors.back().category, diagnostics::ErrorCategory::LIFECYCLE);
  EXPECT_EQ(errors.back().operation, "scope_exit");
  EXPECT_NE(errors.back().message.find("managed release failed"), std::string::npos);
}

TEST_F(DisposableTest, MoveTransfersOwnershipWithoutDoubleRelease) {
  Disposable<TrackedResource> source{TrackedResource{}};
  auto counters = source->counters;

  Disposable<TrackedResource> target{std::move(source)};

  EXPECT_TRUE(source.is_disposed());
  EXPECT_FALSE(target.is_disposed());

  source.dispose();
  EXPECT_EQ(counters->managed.load(), 0);

  target.dispose();
  EXPECT_EQ(counters->managed.load(), 1);
  EXPECT_EQ(counters->unmanaged.load(), 1);
}

TEST_F(DisposableTest, MoveAssignmentDisposesPreviousResource) {
  Disposable<TrackedResource> first{TrackedResource{}};
  Disposable<TrackedResource> second{TrackedResource{}};
  auto first_counters = first->counters;
  auto second_counters = second->counters;

  first = std::move(second);

  EXPECT_EQ(first_counters->managed.load(), 1);
  EXPECT_EQ(second_counters->managed.load(), 0);
  EXPECT_FALSE(first.is_disposed());
  EXPECT_TRUE(second.is_disposed());
}

TEST_F(DisposableTest, MakeDisposedNeverRunsHooks) {
  std::shared_ptr<HookCounters> counters;
  {
    auto handle = Disposable<TrackedResource>::make_disposed(TrackedResource{});
    counters = handle->counters;
    EXPECT_TRUE(handle.is_disposed());
    handle.dispose();
  }

  EXPECT_EQ(counters->managed.load(), 0);
  EXPECT_EQ(counters->unmanaged.load(), 0);
}

TEST_F(DisposableTest, MissingHooksAreOptional) {
  auto unmanaged_only = make_disposable<UnmanagedOnly>();
  auto calls = unmanaged_only->calls;
  unmanaged_only.dispose();
  EXPECT_EQ(*calls, 1);

  auto plain = make_disposable<NoHooks>();
  EXPECT_EQ(plain->value, 7);
  plain.dispose();
  EXPECT_TRUE(plain.is_disposed());
}

TEST_F(DisposableTest, ConcurrentDisposeRunsHooksOnce) {
  // Given
  Disposable<TrackedResource> handle{TrackedResource{}};
  auto counters = handle->counters;
  std::atomic<bool> go{false};

  // When: many threads race to dispose
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&] {
      while (!go.load()) {
        std::this_thread::yield();
      }
      handle.dispose();
    });
  }
  go.store(true);
  for (auto& t : threads) {
    t.join();
  }

  // Then
  EXPECT_TRUE(handle.is_disposed());
  EXPECT_EQ(counters->managed.load(), 1);
  EXPECT_EQ(counters->unmanaged.load(), 1);
}

TEST_F(DisposableTest, HooksRunInOrderExactlyOnce) {
  ::testing::StrictMock<MockReleaseHooks> hooks;
  {
    ::testing::InSequence seq;
    EXPECT_CALL(hooks, release_managed()).Times(1);
    EXPECT_CALL(hooks, release_unmanaged()).Times(1);
  }

  Disposable<MockedResource> handle{MockedResource{&hooks}};
  handle.dispose();
  handle.dispose();
}

TEST_F(DisposableTest, MockedManagedFailureStillReleasesUnmanaged) {
  ::testing::StrictMock<MockReleaseHooks> hooks;
  EXPECT_CALL(hooks, release_managed()).WillOnce(::testing::Throw(std::runtime_error("flush failed")));
  EXPECT_CALL(hooks, release_unmanaged()).Times(1);

  Disposable<MockedResource> handle{MockedResource{&hooks}};
  EXPECT_THROW(handle.dispose(), std::runtime_error);
  EXPECT_TRUE(handle.is_disposed());
}
