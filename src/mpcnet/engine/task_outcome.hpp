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
#pragma once

#include "mpcnet/engine/engine_fwd.hpp"
#include <exception>
#include <cassert>
#include <optional>
#include <string>

namespace mpcnet::engine
{

// Types.

/**
 * What became of one closure run by Dual_pool_engine: either its result, or the exception it threw.
 *
 * Success and failure are explicit: a worker always produces a Task_outcome, whatever the closure did, so the
 * waiting side (Handle::join()) can never be left hanging or crash because of a throwing closure.
 *
 * @tparam Result
 *         The closure's (decayed) return type; Void_result for `void`.
 */
template<typename Result>
class Task_outcome
{
public:
  // Types.

  /// Short-hand for template parameter.
  using Result_obj = Result;

  // Constructors/destructor.

  /**
   * Failed outcome.  Used for tasks that were lost rather than run.
   *
   * @param exc
   *        The reason; must not be null.
   * @param error_message
   *        Description of `exc`.
   * @return See above.
   */
  static Task_outcome failure(std::exception_ptr exc, std::string error_message);

  /**
   * Successful outcome.
   *
   * @param value
   *        The result.
   * @return See above.
   */
  static Task_outcome success(Result&& value);

  // Methods.

  /**
   * Whether the closure returned normally.
   *
   * @return See above.
   */
  bool ok() const;

  /**
   * The result, if ok(); otherwise rethrows the captured exception.
   *
   * @return See above.
   */
  Result& value();

  /**
   * The captured exception, if not ok(); else null.
   *
   * @return See above.
   */
  std::exception_ptr exception() const;

  /**
   * `what()` of the captured exception (or a fixed text for exceptions not derived from `std::exception`), if not
   * ok(); else empty.
   *
   * @return See above.
   */
  const std::string& error_message() const;

private:
  // Constructors.

  /// Leaves everything empty; the factories fill it in.
  Task_outcome();

  // Data.

  /// The result; set if and only if ok().
  std::optional<Result> m_value;

  /// The exception; non-null if and only if not ok().
  std::exception_ptr m_exc;

  /// See error_message().
  std::string m_error_message;
}; // class Task_outcome

// Free functions.

namespace detail
{

/**
 * Invokes `func(args...)` and wraps what happens in a Task_outcome: the returned value (Void_result for `void`)
 * or the exception.
 *
 * @tparam Result
 *         See Task_outcome; must be `Result_of_t<Func, Args...>`.
 * @tparam Func
 *         Closure type.
 * @tparam Args
 *         Argument types.
 * @param func
 *        Closure.
 * @param args
 *        Arguments.
 * @return See above.
 */
template<typename Result, typename Func, typename... Args>
Task_outcome<Result> invoke_capturing(Func& func, Args&... args)
{
  try
  {
    if constexpr(std::is_void_v<std::invoke_result_t<Func&, Args&...>>)
    {
      func(args...);
      return Task_outcome<Result>::success(Void_result());
    }
    else
    {
      return Task_outcome<Result>::success(Result(func(args...)));
    }
  }
  catch (const std::exception& exc)
  {
    return Task_outcome<Result>::failure(std::current_exception(), exc.what());
  }
  catch (...) // Kept; value() rethrows it.
  {
    return Task_outcome<Result>::failure(std::current_exception(),
                                         "Exception of type not derived from std::exception.");
  }
}

} // namespace detail

// Template implementations.

template<typename Result>
Task_outcome<Result>::Task_outcome() = default;

template<typename Result>
Task_outcome<Result> Task_outcome<Result>::failure(std::exception_ptr exc, std::string error_message) // Static.
{
  assert(exc);

  Task_outcome outcome;
  outcome.m_exc = std::move(exc);
  outcome.m_error_message = std::move(error_message);
  return outcome;
}

template<typename Result>
Task_outcome<Result> Task_outcome<Result>::success(Result&& value) // Static.
{
  Task_outcome outcome;
  outcome.m_value.emplace(std::move(value));
  return outcome;
}

template<typename Result>
bool Task_outcome<Result>::ok() const
{
  return !m_exc;
}

template<typename Result>
Result& Task_outcome<Result>::value()
{
  if (m_exc)
  {
    std::rethrow_exception(m_exc);
  }
  // else
  return *m_value;
}

template<typename Result>
std::exception_ptr Task_outcome<Result>::exception() const
{
  return m_exc;
}

template<typename Result>
const std::string& Task_outcome<Result>::error_message() const
{
  return m_error_message;
}

} // namespace mpcnet::engine
