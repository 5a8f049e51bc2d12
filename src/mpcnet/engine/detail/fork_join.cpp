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
#include "mpcnet/engine/detail/fork_join.hpp"
#include <memory>
#include <cassert>

namespace mpcnet::engine::detail
{

namespace
{

/// See this_thread_pool().
thread_local const void* s_this_thread_pool = nullptr;

} // namespace (anon)

// Fork_job implementations.

Fork_job::Fork_job(flow::async::Task&& body) :
  m_body(std::move(body)),
  m_claimed(false),
  m_done(false)
{
  // That's it.
}

bool Fork_job::try_claim()
{
  return !m_claimed.exchange(true);
}

void Fork_job::run()
{
  m_body();

  util::Lock_guard_non_recursive lock(m_mutex);
  m_done = true;
  m_done_cond.notify_all();
}

void Fork_job::wait_done()
{
  util::Lock_guard_non_recursive lock(m_mutex);
  m_done_cond.wait(lock, [&]() -> bool { return m_done; });
}

// Free function implementations.

void fork_join(const Post_func& post, std::vector<flow::async::Task>* thunks, size_t begin, size_t end)
{
  assert(end > begin);

  if ((end - begin) == 1)
  {
    (*thunks)[begin]();
    return;
  }
  // else

  const size_t mid = begin + ((end - begin) / 2);

  // The references stay valid as long as needed: we do not return until the job has run (here or elsewhere).
  auto job = std::make_shared<Fork_job>([&post, thunks, mid, end]() { fork_join(post, thunks, mid, end); });
  post([job]()
  {
    if (job->try_claim())
    {
      job->run();
    }
    // else: The splitter got to it first.
  });

  fork_join(post, thunks, begin, mid);

  if (job->try_claim())
  {
    job->run();
  }
  else
  {
    job->wait_done();
  }
} // fork_join()

const void* this_thread_pool()
{
  return s_this_thread_pool;
}

void set_this_thread_pool(const void* pool)
{
  s_this_thread_pool = pool;
}

} // namespace mpcnet::engine::detail
