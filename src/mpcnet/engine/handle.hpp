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

#include "mpcnet/engine/task_outcome.hpp"
#include <boost/thread/future.hpp>

namespace mpcnet::engine
{

// Types.

/**
 * One-shot receiver of the Task_outcome of a closure spawned via Dual_pool_engine::spawn_net() or
 * Dual_pool_engine::spawn_cpu().  The outcome becomes ready exactly once; join() waits for it and hands it over,
 * after which the Handle is spent (`!valid()`).
 *
 * Movable, not copyable.  A Handle may be dropped without join(); the closure still runs.
 *
 * @tparam Result
 *         See Task_outcome.
 */
template<typename Result>
class Handle
{
public:
  // Types.

  /// Short-hand for the outcome type.
  using Outcome = Task_outcome<Result>;

  // Constructors/destructor.

  /// Constructs a spent (`!valid()`) handle.
  Handle();

  /**
   * Constructs a handle waiting on the given future.
   *
   * @param future
   *        Future whose promise the worker will fulfill.
   */
  explicit Handle(boost::unique_future<Outcome>&& future);

  /**
   * Move constructor.  `src` becomes spent.
   *
   * @param src
   *        Moved-from object.
   */
  Handle(Handle&& src);

  // Methods.

  /**
   * Move assignment.  `src` becomes spent.
   *
   * @param src
   *        Moved-from object.
   * @return `*this`.
   */
  Handle& operator=(Handle&& src);

  /**
   * Whether join() may still be called.
   *
   * @return See above.
   */
  bool valid() const;

  /**
   * Whether the outcome is available, so that join() would not block.
   *
   * @return See above.
   */
  bool is_ready() const;

  /**
   * Blocks until the outcome is ready, then returns it; the handle becomes spent.  If the closure never ran
   * (the engine was destroyed first) the outcome is a failure carrying `boost::broken_promise`; if the handle
   * was already spent, a failure carrying `boost::future_uninitialized`.
   *
   * @return See above.
   */
  Outcome join();

private:
  // Data.

  /// Receiving end of the completion channel.
  boost::unique_future<Outcome> m_future;
}; // class Handle

// Template implementations.

template<typename Result>
Handle<Result>::Handle() = default;

template<typename Result>
Handle<Result>::Handle(boost::unique_future<Outcome>&& future) :
  m_future(boost::move(future))
{
  // That's it.
}

template<typename Result>
Handle<Result>::Handle(Handle&& src) :
  m_future(boost::move(src.m_future))
{
  // That's it.
}

template<typename Result>
Handle<Result>& Handle<Result>::operator=(Handle&& src)
{
  if (&src != this)
  {
    m_future = boost::move(src.m_future);
  }
  return *this;
}

template<typename Result>
bool Handle<Result>::valid() const
{
  return m_future.valid();
}

template<typename Result>
bool Handle<Result>::is_ready() const
{
  return m_future.is_ready();
}

template<typename Result>
typename Handle<Result>::Outcome Handle<Result>::join()
{
  // Take the future out, so we are spent regardless of what get() does.
  boost::unique_future<Outcome> future(boost::move(m_future));
  try
  {
    return future.get();
  }
  catch (const boost::future_error& exc)
  {
    return Outcome::failure(std::current_exception(), exc.what());
  }
}

} // namespace mpcnet::engine
