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
#include <flow/async/async_fwd.hpp>
#include <boost/noncopyable.hpp>
#include <atomic>
#include <vector>

namespace mpcnet::engine::detail
{

// Types.

/**
 * Half of a fork-join split that was handed to a thread pool but may also be run by the thread that split it:
 * whoever claims it first (try_claim()) runs it; the splitter, having lost the race, waits for it to finish.
 */
class Fork_job :
  private boost::noncopyable
{
public:
  // Constructors/destructor.

  /**
   * Stores the body, not yet claimed.
   *
   * @param body
   *        What to run.  Must not throw.
   */
  explicit Fork_job(flow::async::Task&& body);

  // Methods.

  /**
   * Atomically claims the job.  Returns `true` to exactly one caller, who must then call run().
   *
   * @return See above.
   */
  bool try_claim();

  /// Runs the body and marks the job done.  Call only after winning try_claim().
  void run();

  /// Blocks until run() has completed (in whatever thread).
  void wait_done();

private:
  // Data.

  /// See constructor.
  flow::async::Task m_body;

  /// Whether claimed.
  std::atomic<bool> m_claimed;

  /// Protects #m_done.
  util::Mutex_non_recursive m_mutex;

  /// Signaled when #m_done is set.
  util::Condition_variable m_done_cond;

  /// Whether run() completed.
  bool m_done;
}; // class Fork_job

/// Posts a task onto a thread pool (e.g., `Cross_thread_task_loop::post()` with `S_ASYNC`).
using Post_func = Function<void (flow::async::Task&&)>;

// Free functions.

/**
 * Runs `(*thunks)[begin, end)` concurrently by balanced recursive splitting: the right half is posted via `post`;
 * the calling thread recursively runs the left half, then claims back the right half if no pool thread has
 * started it yet, else waits for it.  Posts `end - begin - 1` tasks in total.  Returns when all thunks have
 * completed.
 *
 * May be called from within a pool thread (nested fork-join): claim-back means a thread never waits on a job
 * nobody is running, so this cannot deadlock even with 1 thread.
 *
 * @param post
 *        How to post to the pool.
 * @param thunks
 *        The work items; each must not throw.
 * @param begin
 *        First index.
 * @param end
 *        One past last index; greater than `begin`.
 */
void fork_join(const Post_func& post, std::vector<flow::async::Task>* thunks, size_t begin, size_t end);

/**
 * Returns the pool (as registered via set_this_thread_pool()) the calling thread belongs to; or null.
 *
 * @return See above.
 */
const void* this_thread_pool();

/**
 * Registers the calling thread as belonging to the given pool.  Meant to be called from each pool thread's
 * start-up hook.
 *
 * @param pool
 *        Any stable identifier of the pool, typically its address.
 */
void set_this_thread_pool(const void* pool);

} // namespace mpcnet::engine::detail
