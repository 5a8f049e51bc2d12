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
#include "mpcnet/pool/lane_guard.hpp"
#include "mpcnet/test/test_logger.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <array>
#include <chrono>
#include <atomic>
#include <memory>
#include <numeric>
#include <random>
#include <thread>

namespace mpcnet::pool::test
{

namespace
{

/// Stand-in for a transport: move-only; remembers which lane it is.
struct Fake_lane
{
  std::unique_ptr<size_t> m_id;
};

using Pool = Resource_pool<Fake_lane>;

std::vector<Fake_lane> make_lanes(size_t n, size_t first_id = 0)
{
  std::vector<Fake_lane> lanes;
  for (size_t idx = 0; idx != n; ++idx)
  {
    lanes.push_back(Fake_lane{ std::make_unique<size_t>(first_id + idx) });
  }
  return lanes;
}

flow::log::Logger* quiet_logger()
{
  static mpcnet::test::Test_logger s_logger(flow::log::Sev::S_WARNING);
  return &s_logger;
}

} // Anonymous namespace

TEST(Resource_pool, Round_robin)
{
  for (size_t n_lanes = 1; n_lanes <= 9; ++n_lanes)
  {
    Pool pool(quiet_logger(), make_lanes(n_lanes));
    EXPECT_EQ(pool.size(), n_lanes);
    EXPECT_EQ(pool.n_available(), n_lanes);

    for (size_t ticket = 0; ticket != 5 * n_lanes + 3; ++ticket)
    {
      auto acquired = pool.acquire();
      EXPECT_EQ(acquired.first, ticket % n_lanes);
      EXPECT_EQ(*acquired.second.m_id, ticket % n_lanes); // The lane never changes slots.
      EXPECT_EQ(pool.n_available(), n_lanes - 1);
      EXPECT_TRUE(pool.release(acquired.first, std::move(acquired.second)));
    }
  }
}

TEST(Resource_pool, Round_robin_while_held)
{
  // Hold up to L lanes at once, releasing oldest first.
  constexpr size_t N_LANES = 4;
  Pool pool(quiet_logger(), make_lanes(N_LANES));
  std::vector<Pool::Acquired> held;

  for (size_t ticket = 0; ticket != 40; ++ticket)
  {
    if (held.size() == N_LANES)
    {
      EXPECT_TRUE(pool.release(held.front().first, std::move(held.front().second)));
      held.erase(held.begin());
    }
    held.push_back(pool.acquire());
    EXPECT_EQ(held.back().first, ticket % N_LANES);
  }
}

TEST(Resource_pool, Concrete_scenario)
{
  // Lanes A, B, C at slots 0, 1, 2.
  Pool pool(quiet_logger(), make_lanes(3));

  auto a = pool.acquire();
  EXPECT_EQ(a.first, 0u);
  auto b = pool.acquire();
  EXPECT_EQ(b.first, 1u);
  EXPECT_TRUE(pool.release(a.first, std::move(a.second)));

  auto c = pool.acquire();
  EXPECT_EQ(c.first, 2u);
  EXPECT_EQ(*c.second.m_id, 2u);

  // Ticket 3 needs slot 0, which A's release made available.
  auto a2 = pool.acquire();
  EXPECT_EQ(a2.first, 0u);
  EXPECT_EQ(*a2.second.m_id, 0u);

  // Ticket 4 needs slot 1 (B), still out: it waits until B comes back.
  std::atomic<bool> got(false);
  size_t got_slot = 99;
  std::thread waiter([&]()
  {
    auto acquired = pool.acquire();
    got_slot = acquired.first;
    got = true;
    pool.release(acquired.first, std::move(acquired.second));
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  EXPECT_FALSE(got);
  EXPECT_TRUE(pool.release(c.first, std::move(c.second))); // Not what ticket 4 needs.
  EXPECT_TRUE(pool.release(a2.first, std::move(a2.second)));
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  EXPECT_FALSE(got);

  EXPECT_TRUE(pool.release(b.first, std::move(b.second)));
  waiter.join();
  EXPECT_TRUE(got);
  EXPECT_EQ(got_slot, 1u);
  EXPECT_EQ(pool.n_available(), 3u);
  EXPECT_EQ(pool.acquire().first, 2u); // Ticket 5.
}

TEST(Resource_pool, Out_of_order_release_permutations)
{
  for (size_t n_lanes = 1; n_lanes <= 5; ++n_lanes)
  {
    std::vector<size_t> order(n_lanes);
    std::iota(order.begin(), order.end(), 0);
    do
    {
      // Offset the rotation so the cursor is not at slot 0 when the batch starts.
      for (size_t offset = 0; offset != n_lanes; ++offset)
      {
        Pool pool(quiet_logger(), make_lanes(n_lanes));
        for (size_t idx = 0; idx != offset; ++idx)
        {
          auto acquired = pool.acquire();
          pool.release(acquired.first, std::move(acquired.second));
        }

        std::vector<std::optional<Pool::Acquired>> held(n_lanes);
        for (size_t idx = 0; idx != n_lanes; ++idx)
        {
          auto acquired = pool.acquire();
          ASSERT_EQ(acquired.first, (offset + idx) % n_lanes);
          const size_t slot = acquired.first;
          held[slot].emplace(std::move(acquired));
        }
        EXPECT_EQ(pool.n_available(), 0u);

        for (size_t idx = 0; idx != n_lanes; ++idx)
        {
          const size_t slot = order[idx];
          EXPECT_TRUE(pool.release(slot, std::move(held[slot]->second)));
          EXPECT_EQ(pool.n_available(), idx + 1);
        }

        // Rotation continues where it left off, twice around, with every lane intact.
        for (size_t idx = 0; idx != 2 * n_lanes; ++idx)
        {
          auto acquired = pool.acquire();
          EXPECT_EQ(acquired.first, (offset + idx) % n_lanes);
          EXPECT_EQ(*acquired.second.m_id, acquired.first);
          pool.release(acquired.first, std::move(acquired.second));
        }
      }
    }
    while (std::next_permutation(order.begin(), order.end()));
  }
}

TEST(Resource_pool, Invalid_release)
{
  Pool pool(quiet_logger(), make_lanes(2));

  auto stray = make_lanes(1, 100);
  EXPECT_FALSE(pool.release(2, std::move(stray[0]))); // Out of range.
  EXPECT_TRUE(bool(stray[0].m_id)); // Not moved from.
  EXPECT_FALSE(pool.release(0, std::move(stray[0]))); // Not checked out.

  auto acquired = pool.acquire();
  EXPECT_TRUE(pool.release(acquired.first, std::move(acquired.second)));
  EXPECT_FALSE(pool.release(acquired.first, std::move(stray[0]))); // Double release.

  // Pending (returned out of order) counts as returned, too.
  auto first = pool.acquire();
  auto second = pool.acquire();
  EXPECT_TRUE(pool.release(second.first, std::move(second.second)));
  EXPECT_FALSE(pool.release(second.first, std::move(stray[0])));
  EXPECT_TRUE(pool.release(first.first, std::move(first.second)));
  EXPECT_EQ(pool.n_available(), 2u);
}

TEST(Resource_pool, Async_acquire)
{
  Pool pool(quiet_logger(), make_lanes(2));

  std::vector<std::pair<size_t, Fake_lane>> granted;
  const auto handler = [&](size_t slot, Fake_lane&& lane) { granted.emplace_back(slot, std::move(lane)); };

  pool.async_acquire(handler); // Immediate: invoked synchronously.
  ASSERT_EQ(granted.size(), 1u);
  EXPECT_EQ(granted[0].first, 0u);

  auto held = pool.acquire(); // Slot 1.
  EXPECT_EQ(held.first, 1u);

  pool.async_acquire(handler); // Needs slot 0: parked.
  pool.async_acquire(handler); // Then slot 1: parked.
  EXPECT_EQ(granted.size(), 1u);

  // Slot 1 first: the request waiting for it is served from within release(), though the earlier one is not.
  EXPECT_TRUE(pool.release(held.first, std::move(held.second)));
  ASSERT_EQ(granted.size(), 2u);
  EXPECT_EQ(granted[1].first, 1u);
  EXPECT_EQ(*granted[1].second.m_id, 1u);

  // Slot 0 back: the remaining request gets it.
  const size_t slot0 = granted[0].first;
  EXPECT_TRUE(pool.release(slot0, std::move(granted[0].second)));
  ASSERT_EQ(granted.size(), 3u);
  EXPECT_EQ(granted[2].first, 0u);
  EXPECT_EQ(*granted[2].second.m_id, 0u);
  EXPECT_EQ(pool.n_available(), 0u);
}

TEST(Resource_pool, No_head_of_line_blocking)
{
  Pool pool(quiet_logger(), make_lanes(3));
  auto first = pool.acquire(); // 0.
  auto second = pool.acquire(); // 1.
  auto third = pool.acquire(); // 2.

  // Ticket 3 needs slot 0, which stays out for now.
  std::optional<Pool::Acquired> ticket3;
  pool.async_acquire([&](size_t slot, Fake_lane&& lane) { ticket3.emplace(slot, std::move(lane)); });
  EXPECT_FALSE(ticket3);

  // Slot 1 comes back; ticket 4 needs it and must not queue behind ticket 3.
  EXPECT_TRUE(pool.release(second.first, std::move(second.second)));
  std::atomic<bool> got(false);
  size_t got_slot = 99;
  std::thread ticket4([&]()
  {
    auto acquired = pool.acquire();
    got_slot = acquired.first;
    got = true;
    pool.release(acquired.first, std::move(acquired.second));
  });

  for (size_t idx = 0; (idx != 200) && (!got); ++idx)
  {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  EXPECT_TRUE(got);
  EXPECT_FALSE(ticket3);

  // Now slot 0: ticket 3 is served at last.
  EXPECT_TRUE(pool.release(first.first, std::move(first.second)));
  ticket4.join();
  EXPECT_EQ(got_slot, 1u);
  ASSERT_TRUE(ticket3);
  EXPECT_EQ(ticket3->first, 0u);
  EXPECT_EQ(*ticket3->second.m_id, 0u);

  /* 2 blocking requests, tickets 5 and 6, for slots 2 and 0, both out.  Ticket 6's lane comes back first, and it
   * is served without waiting for ticket 5's. */
  std::atomic<int> n_done(0);
  std::atomic<size_t> first_slot(99);
  const auto wait_for_lane = [&]()
  {
    auto acquired = pool.acquire();
    size_t none = 99;
    first_slot.compare_exchange_strong(none, acquired.first);
    ++n_done;
    pool.release(acquired.first, std::move(acquired.second));
  };
  std::thread waiter_a(wait_for_lane);
  std::thread waiter_b(wait_for_lane);
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  EXPECT_EQ(n_done.load(), 0);

  EXPECT_TRUE(pool.release(ticket3->first, std::move(ticket3->second))); // Slot 0.
  for (size_t idx = 0; (idx != 200) && (n_done.load() == 0); ++idx)
  {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  EXPECT_EQ(n_done.load(), 1);
  EXPECT_EQ(first_slot.load(), 0u);

  EXPECT_TRUE(pool.release(third.first, std::move(third.second))); // Slot 2.
  waiter_a.join();
  waiter_b.join();
  EXPECT_EQ(n_done.load(), 2);
  EXPECT_EQ(pool.n_available(), 3u);
}

TEST(Resource_pool, Async_acquire_reentrant)
{
  // A handler may call back into the pool.
  Pool pool(quiet_logger(), make_lanes(1));
  size_t n_grants = 0;

  Pool::Acquire_handler handler = [&](size_t slot, Fake_lane&& lane)
  {
    ++n_grants;
    EXPECT_EQ(slot, 0u);
    EXPECT_TRUE(pool.release(slot, std::move(lane)));
  };
  for (size_t idx = 0; idx != 5; ++idx)
  {
    auto copy = handler;
    pool.async_acquire(std::move(copy));
  }
  EXPECT_EQ(n_grants, 5u);
  EXPECT_EQ(pool.n_available(), 1u);
}

TEST(Resource_pool, Insert)
{
  Pool pool(quiet_logger(), make_lanes(3));

  EXPECT_EQ(pool.insert(std::move(make_lanes(1, 3)[0])), 3u);
  EXPECT_EQ(pool.size(), 4u);

  // L + 1 acquisitions (no releases) yield every lane once, the new one included.
  std::vector<Pool::Acquired> held;
  for (size_t idx = 0; idx != 4; ++idx)
  {
    held.push_back(pool.acquire());
    EXPECT_EQ(held.back().first, idx);
    EXPECT_EQ(*held.back().second.m_id, idx);
  }
  for (auto& acquired : held)
  {
    pool.release(acquired.first, std::move(acquired.second));
  }
  EXPECT_EQ(pool.acquire().first, 0u);
}

TEST(Resource_pool, Insert_while_out)
{
  Pool pool(quiet_logger(), make_lanes(2));

  auto first = pool.acquire(); // 0.
  auto second = pool.acquire(); // 1.

  // Slot 1 (before the new slot) is out, so the new lane waits its turn behind it.
  EXPECT_EQ(pool.insert(std::move(make_lanes(1, 2)[0])), 2u);
  EXPECT_EQ(pool.n_available(), 1u);

  EXPECT_TRUE(pool.release(second.first, std::move(second.second)));
  EXPECT_TRUE(pool.release(first.first, std::move(first.second)));

  // Rotation continues at the cursor (slot 0), now through 3 lanes.
  for (const size_t expected : { 0u, 1u, 2u, 0u })
  {
    auto acquired = pool.acquire();
    EXPECT_EQ(acquired.first, expected);
    EXPECT_EQ(*acquired.second.m_id, expected);
    pool.release(acquired.first, std::move(acquired.second));
  }
}

TEST(Resource_pool, Insert_into_empty)
{
  Pool pool(quiet_logger(), make_lanes(0));
  EXPECT_EQ(pool.size(), 0u);
  EXPECT_FALSE(pool.remove());

  std::thread waiter([&]()
  {
    auto acquired = pool.acquire(); // Waits for a lane to exist.
    EXPECT_EQ(acquired.first, 0u);
    pool.release(acquired.first, std::move(acquired.second));
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_EQ(pool.insert(std::move(make_lanes(1)[0])), 0u);
  waiter.join();
  EXPECT_EQ(pool.n_available(), 1u);
}

TEST(Resource_pool, Remove)
{
  Pool pool(quiet_logger(), make_lanes(3));

  auto removed = pool.remove();
  ASSERT_TRUE(removed);
  EXPECT_EQ(*removed->m_id, 2u);
  EXPECT_EQ(pool.size(), 2u);

  for (size_t ticket = 0; ticket != 10; ++ticket)
  {
    auto acquired = pool.acquire();
    EXPECT_EQ(acquired.first, ticket % 2);
    EXPECT_NE(*acquired.second.m_id, 2u);
    pool.release(acquired.first, std::move(acquired.second));
  }

  // Newest lane checked out: cannot remove.
  auto first = pool.acquire(); // 0.
  auto second = pool.acquire(); // 1.
  EXPECT_FALSE(pool.remove());
  EXPECT_EQ(pool.size(), 2u);

  // Returned out of order (pending): can remove.
  EXPECT_TRUE(pool.release(second.first, std::move(second.second)));
  removed = pool.remove();
  ASSERT_TRUE(removed);
  EXPECT_EQ(*removed->m_id, 1u);
  EXPECT_TRUE(pool.release(first.first, std::move(first.second)));

  EXPECT_EQ(pool.size(), 1u);
  for (size_t ticket = 0; ticket != 3; ++ticket)
  {
    auto acquired = pool.acquire();
    EXPECT_EQ(acquired.first, 0u);
    pool.release(acquired.first, std::move(acquired.second));
  }
}

TEST(Resource_pool, Remove_at_cursor)
{
  Pool pool(quiet_logger(), make_lanes(3));
  for (size_t idx = 0; idx != 2; ++idx)
  {
    auto acquired = pool.acquire();
    pool.release(acquired.first, std::move(acquired.second));
  }
  // Cursor is at slot 2, the newest; removing it moves the rotation on to slot 0.
  auto removed = pool.remove();
  ASSERT_TRUE(removed);
  EXPECT_EQ(pool.acquire().first, 0u);
}

TEST(Lane_guard, Scoped)
{
  Pool pool(quiet_logger(), make_lanes(2));
  {
    Lane_guard<Fake_lane> lane(&pool);
    EXPECT_TRUE(lane.holds());
    EXPECT_EQ(lane.slot(), 0u);
    EXPECT_EQ(*lane->m_id, 0u);
    EXPECT_EQ(pool.n_available(), 1u);

    Lane_guard<Fake_lane> moved(std::move(lane));
    EXPECT_FALSE(lane.holds());
    EXPECT_EQ(moved.slot(), 0u);
    EXPECT_EQ(pool.n_available(), 1u);
  }
  EXPECT_EQ(pool.n_available(), 2u);

  // Released on the exception path as well.
  try
  {
    Lane_guard<Fake_lane> lane(&pool);
    EXPECT_EQ(lane.slot(), 1u);
    throw std::runtime_error("boom");
  }
  catch (const std::runtime_error&)
  {
  }
  EXPECT_EQ(pool.n_available(), 2u);

  Lane_guard<Fake_lane> lane(&pool);
  lane.release();
  EXPECT_FALSE(lane.holds());
  lane.release(); // No-op.
  EXPECT_EQ(pool.n_available(), 2u);
}

TEST(Resource_pool, Concurrent_no_double_issue)
{
  constexpr size_t N_LANES = 4;
  constexpr size_t N_THREADS = 12;
  constexpr size_t N_ROUNDS = 2000;

  Pool pool(quiet_logger(), make_lanes(N_LANES));
  std::array<std::atomic<int>, N_LANES> holders{};
  std::atomic<bool> double_issue(false);
  std::atomic<bool> wrong_lane(false);

  std::vector<std::thread> threads;
  for (size_t thread_idx = 0; thread_idx != N_THREADS; ++thread_idx)
  {
    threads.emplace_back([&, thread_idx]()
    {
      std::mt19937 rng(unsigned(thread_idx));
      for (size_t round = 0; round != N_ROUNDS; ++round)
      {
        Lane_guard<Fake_lane> lane(&pool);
        if (holders[lane.slot()].fetch_add(1) != 0)
        {
          double_issue = true;
        }
        if (*lane->m_id != lane.slot())
        {
          wrong_lane = true;
        }
        if ((rng() % 4) == 0)
        {
          std::this_thread::yield();
        }
        holders[lane.slot()].fetch_sub(1);
      }
    });
  }
  for (auto& thread : threads)
  {
    thread.join();
  }

  EXPECT_FALSE(double_issue);
  EXPECT_FALSE(wrong_lane);
  EXPECT_EQ(pool.n_available(), N_LANES);
  // N_THREADS * N_ROUNDS tickets were drawn; the next one continues the rotation.
  EXPECT_EQ(pool.acquire().first, (N_THREADS * N_ROUNDS) % N_LANES);
}

TEST(Resource_pool, Concurrent_out_of_order_stress)
{
  /* Each thread holds 1 or 2 lanes and releases them in random order, so the pending-return buffer is exercised
   * under contention.  A thread draws its tickets back to back (under acquire_mutex): so it never draws the slot of
   * a lane it holds itself, and whoever holds the lane it waits for is releasing, not acquiring. */
  constexpr size_t N_THREADS = 4;
  constexpr size_t N_LANES = 2 * N_THREADS;
  constexpr size_t N_ROUNDS = 1500;

  Pool pool(quiet_logger(), make_lanes(N_LANES));
  std::array<std::atomic<int>, N_LANES> holders{};
  std::atomic<bool> double_issue(false);
  std::atomic<size_t> n_acquires(0);
  util::Mutex_non_recursive acquire_mutex;

  std::vector<std::thread> threads;
  for (size_t thread_idx = 0; thread_idx != N_THREADS; ++thread_idx)
  {
    threads.emplace_back([&, thread_idx]()
    {
      std::mt19937 rng(unsigned(thread_idx) + 17);
      for (size_t round = 0; round != N_ROUNDS; ++round)
      {
        std::vector<Pool::Acquired> held;
        const size_t n_held = 1 + (rng() % 2);
        {
          util::Lock_guard_non_recursive lock(acquire_mutex);
          for (size_t idx = 0; idx != n_held; ++idx)
          {
            held.push_back(pool.acquire());
            ++n_acquires;
            if (holders[held.back().first].fetch_add(1) != 0)
            {
              double_issue = true;
            }
          }
        }
        std::shuffle(held.begin(), held.end(), rng);
        for (auto& acquired : held)
        {
          holders[acquired.first].fetch_sub(1);
          EXPECT_TRUE(pool.release(acquired.first, std::move(acquired.second)));
        }
      }
    });
  }
  for (auto& thread : threads)
  {
    thread.join();
  }

  EXPECT_FALSE(double_issue);
  EXPECT_EQ(pool.n_available(), N_LANES);
  for (size_t idx = 0; idx != N_LANES; ++idx)
  {
    auto acquired = pool.acquire();
    EXPECT_EQ(acquired.first, (n_acquires + idx) % N_LANES);
    EXPECT_EQ(*acquired.second.m_id, acquired.first);
    pool.release(acquired.first, std::move(acquired.second));
  }
}

} // namespace mpcnet::pool::test
