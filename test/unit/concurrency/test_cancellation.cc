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
#include <stdexcept>
#include <string>

#include "corekit/concurrency/cancellation.hpp"
#include "corekit/diagnostics/exceptions.hpp"

using namespace corekit;
using namespace corekit::concurrency;

TEST(CancellationTest, DefaultTokenIsNeverCancelled) {
  CancellationToken token;

  EXPECT_FALSE(token.is_cancelled());
  EXPECT_FALSE(token.can_be_cancelled());
  EXPECT_FALSE(static_cast<bool>(token));
  EXPECT_NO_THROW(token.throw_if_cancelled());
  EXPECT_EQ(token.register_callback([] { FAIL() << "must not run"; }), 0u);
}

TEST(CancellationTest, CancelIsVisibleThroughEveryToken) {
  CancellationSource source;
  auto first = source.token();
  auto second = first;

  EXPECT_TRUE(first.can_be_cancelled());
  EXPECT_FALSE(first.is_cancelled());

  source.cancel();

  EXPECT_TRUE(source.is_cancelled());
  EXPECT_TRUE(first.is_cancelled());
  EXPECT_TRUE(second.is_cancelled());
}

TEST(CancellationTest, ThrowIfCancelledRaisesOperationCancelled) {
  CancellationSource source;
  auto token = source.token();
  source.cancel();

  try {
    token.throw_if_cancelled("download");
    FAIL() << "Expected OperationCancelledException";
  } catch (const diagnostics::OperationCancelledException& e) {
    EXPECT_EQ(e.get_operation(), "download");
    EXPECT_EQ(e.get_component(), "cancellation");
  }
}

TEST(CancellationTest, CallbacksFireExactlyOnce) {
  CancellationSource source;
  auto token = source.token();
  std::atomic<int> fired{0};

  token.register_callback([&] { ++fired; });
  token.register_callback([&] { ++fired; });

  source.cancel();
  source.cancel();

  EXPECT_EQ(fired.load(), 2);
}

TEST(CancellationTest, UnregisteredCallbackDoesNotFire) {
  CancellationSource source;
  auto token = source.token();
  bool fired = false;

  auto id = token.register_callback([&] { fired = true; });
  EXPECT_NE(id, 0u);
  token.unregister_callback(id);
  source.cancel();

  EXPECT_FALSE(fired);
}

TEST(CancellationTest, RegisterAfterCancelRunsImmediately) {
  CancellationSource source;
  source.cancel();
  bool fired = false;

  auto id = source.token().register_callback([&] { fired = true; });

  EXPECT_TRUE(fired);
  EXPECT_EQ(id, 0u);
}

TEST(CancellationTest, CallbackMayRegisterAnotherCallback) {
  CancellationSource source;
  auto token = source.token();
  bool nested_fired = false;

  token.register_callback([&] { token.register_callback([&] { nested_fired = true; }); });
  source.cancel();

  EXPECT_TRUE(nested_fired);
}
