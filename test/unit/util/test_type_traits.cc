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

#include <map>
#include <memory>
#include <vector>

#include "corekit/lifecycle/disposable.hpp"
#include "corekit/util/type_traits.hpp"

using namespace corekit::util;

namespace {

struct Shape {
  virtual ~Shape() = default;
  virtual double area() const = 0;
};

struct Square : Shape {
  double area() const override { return 1.0; }
};

template <typename T>
struct Tagged {
  T tag;
};

struct TaggedSquare : Square, Tagged<int> {};

struct NoopResource {
  void release_managed() {}
};

}  // namespace

TEST(TypeTraitsTest, IsConcrete) {
  EXPECT_FALSE(is_concrete_v<Shape>);
  EXPECT_TRUE(is_concrete_v<Square>);
  EXPECT_TRUE(is_concrete_v<int>);
}

TEST(TypeTraitsTest, IsSpecializationOf) {
  EXPECT_TRUE((is_specialization_of_v<std::vector<int>, std::vector>));
  EXPECT_TRUE((is_specialization_of_v<std::map<int, double>, std::map>));
  EXPECT_FALSE((is_specialization_of_v<std::vector<int>, std::map>));
  EXPECT_TRUE((is_specialization_of_v<corekit::lifecycle::Disposable<NoopResource>, corekit::lifecycle::Disposable>));
}

TEST(TypeTraitsTest, DerivesFromTemplate) {
  EXPECT_TRUE((derives_from_template_v<TaggedSquare, Tagged>));
  EXPECT_TRUE((derives_from_template_v<Tagged<char>, Tagged>));
  EXPECT_FALSE((derives_from_template_v<Square, Tagged>));
  EXPECT_FALSE((derives_from_template_v<int, Tagged>));
}
