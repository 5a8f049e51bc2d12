/* mpcnet: Lane-Pooled MPC Networking
 * Copyright (c) 2023 Akamai Technologies, Inc.; and other contributors.
 * Each commit is copyright by its respective author or author's employer.
 *
 * Licensed under the MIT License:
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE. */

/// @file
#include "mpcnet/engine/handle.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <thread>

namespace mpcnet::engine::test
{

TEST(Task_outcome, Capture)
{
  int calls = 0;
  auto add = [&](int x) { ++calls; return x + 1; };
  int arg = 41;
  auto outcome = detail::invoke_capturing<int>(add, arg);
  EXPECT_TRUE(outcome.ok());
  EXPECT_EQ(outcome.value(), 42);
  EXPECT_FALSE(outcome.exception());
  EXPECT_TRUE(outcome.error_message().empty());

  auto nothing = [&]() { ++calls; };
  auto void_outcome = detail::invoke_capturing<Void_result>(nothing);
  EXPECT_TRUE(void_outcome.ok());
  EXPECT_EQ(void_outcome.value(), Void_result());
  EXPECT_EQ(calls, 2);

  auto thrower = []() -> std::string { throw std::invalid_argument("bad input"); };
  auto failed = detail::invoke_capturing<std::string>(thrower);
  EXPECT_FALSE(failed.ok());
  EXPECT_TRUE(bool(failed.exception()));
  EXPECT_EQ(failed.error_message(), "bad input");
  EXPECT_THROW(failed.value(), std::invalid_argument);

  auto odd_thrower = []() -> int { throw 7; };
  auto odd = detail::invoke_capturing<int>(odd_thrower);
  EXPECT_FALSE(odd.ok());
  EXPECT_FALSE(odd.error_message().empty());
  EXPECT_THROW(odd.value(), int);
}

TEST(Handle, Join)
{
  using Outcome = Task_outcome<int>;

  boost::promise<Outcome> promise;
  Handle<int> handle(promise.get_future());
  EXPECT_TRUE(handle.valid());
  EXPECT_FALSE(handle.is_ready());

  std::thread worker([&]() { promise.set_value(Outcome::success(5)); });
  auto outcome = handle.join();
  worker.join();

  EXPECT_TRUE(outcome.ok());
  EXPECT_EQ(outcome.value(), 5);
  EXPECT_FALSE(handle.valid()); // Consumed.

  // Joining a spent handle reports failure rather than crashing.
  auto again = handle.join();
  EXPECT_FALSE(again.ok());
  EXPECT_FALSE(again.error_message().empty());
}

TEST(Handle, Failure_and_broken_promise)
{
  using Outcome = Task_outcome<int>;

  Handle<int> failing;
  EXPECT_FALSE(failing.valid());
  {
    boost::promise<Outcome> promise;
    failing = Handle<int>(promise.get_future());
    promise.set_value(Outcome::failure(std::make_exception_ptr(std::runtime_error("worker failed")),
                                       "worker failed"));
  }
  EXPECT_TRUE(failing.is_ready());
  auto outcome = failing.join();
  EXPECT_FALSE(outcome.ok());
  EXPECT_EQ(outcome.error_message(), "worker failed");
  EXPECT_THROW(outcome.value(), std::runtime_error);

  Handle<int> abandoned;
  {
    boost::promise<Outcome> promise;
    abandoned = Handle<int>(promise.get_future());
  } // Promise destroyed unfulfilled.
  auto broken = abandoned.join();
  EXPECT_FALSE(broken.ok());
  EXPECT_FALSE(broken.error_message().empty());
  EXPECT_THROW(broken.value(), boost::future_error);

  Handle<int> moved(std::move(failing));
  EXPECT_FALSE(moved.valid());
}

} // namespace mpcnet::engine::test
