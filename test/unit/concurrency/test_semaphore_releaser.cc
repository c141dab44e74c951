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

#include <gtest/gtest.h>

#include <atomic>
#include <boost/asio/bind_executor.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <thread>

#include "corekit/concurrency/semaphore_releaser.hpp"
#include "test_utils.hpp"

using namespace corekit;
using namespace corekit::concurrency;
using namespace corekit::test;
using namespace std::chrono_literals;

class SemaphoreReleaserTest : public DiagnosticsTest {
 protected:
  boost::asio::io_context ioc_;
};

TEST_F(SemaphoreReleaserTest, SequentialScopedAcquisitionsRestoreCount) {
  CountingSemaphore sem(ioc_, 1);

  {
    auto releaser = acquire_and_release(sem);
    EXPECT_FALSE(releaser.is_disposed());
    EXPECT_EQ(sem.available(), 0);
  }
  EXPECT_EQ(sem.available(), 1);

  {
    auto releaser = acquire_and_release(sem);
    EXPECT_EQ(sem.available(), 0);
  }
  EXPECT_EQ(sem.available(), 1);
}

TEST_F(SemaphoreReleaserTest, DoubleDisposeReleasesOnce) {
  CountingSemaphore sem(ioc_, 2);

  auto releaser = acquire_and_release(sem);
  EXPECT_EQ(sem.available(), 1);

  releaser.dispose();
  releaser.dispose();

  EXPECT_EQ(sem.available(), 2);
  EXPECT_TRUE(releaser.is_disposed());
}

TEST_F(SemaphoreReleaserTest, ExplicitDisposeThenScopeExitReleasesOnce) {
  CountingSemaphore sem(ioc_, 1, 1);

  {
    auto releaser = acquire_and_release(sem);
    releaser.dispose();
    EXPECT_EQ(sem.available(), 1);
  }

  // A second release would have exceeded max_count and been reported
  EXPECT_EQ(sem.available(), 1);
  EXPECT_FALSE(diagnostics::ErrorHandler::instance().has_errors("disposable"));
}

TEST_F(SemaphoreReleaserTest, MovedReleaserReleasesOnce) {
  CountingSemaphore sem(ioc_, 1, 1);

  std::optional<SemaphoreReleaser> holder;
  {
    auto releaser = acquire_and_release(sem);
    holder.emplace(std::move(releaser));
  }
  EXPECT_EQ(sem.available(), 0);

  holder.reset();
  EXPECT_EQ(sem.available(), 1);
}

TEST_F(SemaphoreReleaserTest, SecondAcquisitionBlocksUntilRelease) {
  CountingSemaphore sem(ioc_, 1);
  auto first = acquire_and_release(sem);
  std::atomic<bool> second_acquired{false};

  std::thread contender([&] {
    auto second = acquire_and_release(sem);
    second_acquired = true;
  });

  ASSERT_TRUE(TestUtils::waitForCondition([&] { return sem.waiting() == 1; }));
  EXPECT_FALSE(second_acquired.load());

  first.dispose();
  contender.join();

  EXPECT_TRUE(second_acquired.load());
  EXPECT_EQ(sem.available(), 1);
}

TEST_F(SemaphoreReleaserTest, TimedAcquisitionTimesOutWithoutThrowing) {
  CountingSemaphore sem(ioc_, 1);
  auto held = acquire_and_release(sem);

  std::optional<SemaphoreReleaser> attempt;
  EXPECT_NO_THROW(attempt = try_acquire_and_release_for(sem, 20ms));
  EXPECT_FALSE(attempt.has_value());
  EXPECT_EQ(sem.available(), 0);

  held.dispose();
  EXPECT_EQ(sem.available(), 1);

  auto granted = try_acquire_and_release_until(sem, std::chrono::steady_clock::now() + 1s);
  ASSERT_TRUE(granted.has_value());
  EXPECT_EQ(sem.available(), 0);
  granted->dispose();
  EXPECT_EQ(sem.available(), 1);
}

TEST_F(SemaphoreReleaserTest, AsyncAcquisitionReturnsLiveHandle) {
  CountingSemaphore sem(ioc_, 1);
  std::optional<AsyncSemaphoreReleaser> handle;
  std::optional<boost::system::error_code> result;

  async_acquire_and_release(sem, [&](boost::system::error_code ec, AsyncSemaphoreReleaser releaser) {
    result = ec;
    handle.emplace(std::move(releaser));
  });

  ASSERT_TRUE(TestUtils::runUntil(ioc_, [&] { return result.has_value(); }));
  EXPECT_FALSE(*result);
  ASSERT_TRUE(handle.has_value());
  EXPECT_FALSE(handle->is_disposed());
  EXPECT_EQ(sem.available(), 0);

  bool disposed = false;
  handle->async_dispose([&](boost::system::error_code ec) {
    EXPECT_FALSE(ec);
    disposed = true;
  });
  ASSERT_TRUE(TestUtils::runUntil(ioc_, [&] { return disposed; }));
  EXPECT_EQ(sem.available(), 1);

  // Sync dispose and scope exit after async disposal are no-ops
  handle->dispose();
  handle.reset();
  EXPECT_EQ(sem.available(), 1);
}

TEST_F(SemaphoreReleaserTest, AsyncAcquisitionStaysPendingUntilRelease) {
  CountingSemaphore sem(ioc_, 1);
  auto first = acquire_and_release(sem);
  std::optional<boost::system::error_code> result;
  std::optional<AsyncSemaphoreReleaser> handle;

  async_acquire_and_release(sem, [&](boost::system::error_code ec, AsyncSemaphoreReleaser releaser) {
    result = ec;
    handle.emplace(std::move(releaser));
  });

  ioc_.run_for(20ms);
  EXPECT_FALSE(result.has_value());

  first.dispose();

  ASSERT_TRUE(TestUtils::runUntil(ioc_, [&] { return result.has_value(); }));
  EXPECT_FALSE(*result);
  EXPECT_EQ(sem.available(), 0);
  handle.reset();
  EXPECT_EQ(sem.available(), 1);
}

TEST_F(SemaphoreReleaserTest, AsyncTimeoutIsDistinctFromCancellation) {
  CountingSemaphore sem(ioc_, 0);
  std::optional<boost::system::error_code> result;
  bool handle_disposed = false;

  async_acquire_and_release_for(sem, 20ms, [&](boost::system::error_code ec, AsyncSemaphoreReleaser releaser) {
    result = ec;
    handle_disposed = releaser.is_disposed();
  });

  ASSERT_TRUE(TestUtils::runUntil(ioc_, [&] { return result.has_value(); }));
  EXPECT_EQ(*result, boost::asio::error::timed_out);
  EXPECT_TRUE(handle_disposed);
  EXPECT_EQ(sem.available(), 0);
}

TEST_F(SemaphoreReleaserTest, AsyncCancellationLeavesSemaphoreUntouched) {
  CountingSemaphore sem(ioc_, 0);
  CancellationSource source;
  std::optional<boost::system::error_code> result;

  async_acquire_and_release_until(sem, CountingSemaphore::clock_type::now() + 10s, source.token(),
                                  [&](boost::system::error_code ec, AsyncSemaphoreReleaser releaser) {
                                    result = ec;
                                    EXPECT_TRUE(releaser.is_disposed());
                                  });
  source.cancel();

  ASSERT_TRUE(TestUtils::runUntil(ioc_, [&] { return result.has_value(); }));
  EXPECT_EQ(*result, boost::asio::error::operation_aborted);
  EXPECT_EQ(sem.available(), 0);

  sem.release();
  EXPECT_EQ(sem.available(), 1);
}

TEST_F(SemaphoreReleaserTest, AsyncCancellationTokenOverload) {
  CountingSemaphore sem(ioc_, 0);
  CancellationSource source;
  std::optional<boost::system::error_code> result;

  async_acquire_and_release(sem, source.token(),
                            [&](boost::system::error_code ec, AsyncSemaphoreReleaser) { result = ec; });
  source.cancel();

  ASSERT_TRUE(TestUtils::runUntil(ioc_, [&] { return result.has_value(); }));
  EXPECT_EQ(*result, boost::asio::error::operation_aborted);
}

TEST_F(SemaphoreReleaserTest, SlotIsReturnedWhenCompletionContextIsDestroyed) {
  CountingSemaphore sem(ioc_, 1, 1);
  auto first = acquire_and_release(sem);
  bool delivered = false;

  // Given: A pending scoped acquisition whose handler is bound to its own context
  auto other = std::make_unique<boost::asio::io_context>();
  async_acquire_and_release(sem, boost::asio::bind_executor(*other, [&](boost::system::error_code,
                                                                         AsyncSemaphoreReleaser) { delivered = true; }));

  // When: The slot is granted, then the context is torn down before the handler runs
  first.dispose();
  EXPECT_EQ(sem.available(), 0);
  other.reset();

  // Then: No handle was ever delivered and the slot is not lost
  EXPECT_FALSE(delivered);
  EXPECT_EQ(sem.available(), 1);

  auto next = try_acquire_and_release_for(sem, 100ms);
  ASSERT_TRUE(next.has_value());
  next->dispose();
  EXPECT_EQ(sem.available(), 1);
}

TEST_F(SemaphoreReleaserTest, AsyncAcquisitionWithMaximalTimeoutStaysPending) {
  CountingSemaphore sem(ioc_, 0, 1);
  std::optional<boost::system::error_code> result;
  std::optional<AsyncSemaphoreReleaser> handle;

  async_acquire_and_release_for(sem, std::chrono::milliseconds::max(),
                                [&](boost::system::error_code ec, AsyncSemaphoreReleaser releaser) {
                                  result = ec;
                                  handle.emplace(std::move(releaser));
                                });

  EXPECT_FALSE(TestUtils::runUntil(ioc_, [&] { return result.has_value(); }, 50));

  sem.release();
  ASSERT_TRUE(TestUtils::runUntil(ioc_, [&] { return result.has_value(); }));
  EXPECT_FALSE(*result);
  ASSERT_TRUE(handle.has_value());
  EXPECT_FALSE(handle->is_disposed());
  EXPECT_EQ(sem.available(), 0);
}
