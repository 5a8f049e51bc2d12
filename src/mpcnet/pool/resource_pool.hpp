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

#include "mpcnet/pool/pool_fwd.hpp"
#include <boost/noncopyable.hpp>
#include <map>
#include <optional>
#include <utility>
#include <vector>

namespace mpcnet::pool
{

// Types.

/**
 * Thread-safe pool of `L` interchangeable resources (*lanes*), each identified by its *slot* `0..L-1`, handed out
 * one at a time to concurrent callers in strict rotation: the lanes are used in the order
 * `0, 1, ..., L-1, 0, 1, ...`.  It is designed for the transport lanes of an MPC session (see
 * transport::Socket_transport and friends), where parallel protocol steps must each have a lane to themselves,
 * and all parties must pick the same lane for the same step.  The latter holds because the slot a caller gets is
 * a function of only its position in the sequence of acquire calls, not of timing.
 *
 * ### Tickets and the rotation ###
 * Each acquire() (or async_acquire()) call draws the next *ticket* `0, 1, 2, ...` and, with it, its *required
 * slot*: the slot at the *cursor*, which then moves on to the next slot.  Hence, with `L` fixed since
 * construction, ticket `t` requires (and receives) slot `t mod L`.  The request is granted as soon as the lane at
 * its required slot is in the pool and no earlier ticket is waiting for that same slot.  Requests for different
 * slots never wait on each other: if ticket 3 waits for slot 0, ticket 4 still gets slot 1 the moment it is
 * there.  A caller whose lane is out is parked until it comes back; there is no busy-waiting, and a release wakes
 * only the one caller waiting for that lane (not all of them).
 *
 * ### Out-of-order release ###
 * Lanes may be released in any order.  A released lane goes straight to the earliest request waiting for its
 * slot, if any.  Otherwise it goes back into the pool; internally the ring of slots is split into the *run*, the
 * contiguous sequence of lanes in the pool starting at the cursor, and the rest, starting at the run's *tail*,
 * which are out.  A lane released at the tail extends the run; one released elsewhere waits in a *pending-return
 * buffer* until the lanes before it come back, and then joins the run.  A pending lane is still in the pool: it
 * is handed out when its slot's turn comes.  A lane is never handed to 2 holders.
 *
 * ### Elastic membership ###
 * insert() adds a lane as slot `L`; remove() takes out the newest lane (slot `L-1`) if it is in the pool.  The
 * rotation continues from the cursor with the new `L`; requests drawn earlier keep the slot they drew.  `L` may be
 * zero, in which case acquirers wait for slot 0, i.e., for the next insert().
 *
 * ### Failure modes ###
 * There are none in the usual sense: acquire() waits as long as it takes.  The flip side is that a lane that is
 * never released stalls, for good, every request that draws its slot.  Use Lane_guard to make sure this cannot
 * happen due to an exception.  Likewise a caller holding a lane while acquiring another may draw its own lane's
 * slot (if `L` tickets were drawn in between) and then waits forever.
 *
 * ### Thread safety ###
 * All methods may be called concurrently.  All state is protected by one mutex, held briefly.
 *
 * @tparam Resource
 *         Movable type of the pooled thing; need not be default-constructible or copyable.
 */
template<typename Resource>
class Resource_pool :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Types.

  /// Short-hand for template parameter.
  using Resource_obj = Resource;

  /// A granted lane: slot and resource.
  using Acquired = std::pair<size_t, Resource>;

  /**
   * Handler type for async_acquire(): invoked once with the granted slot and resource.  The handler becomes
   * responsible for eventually passing both to release().
   */
  using Acquire_handler = Function<void (size_t slot, Resource&& resource)>;

  // Constructors/destructor.

  /**
   * Constructs the pool: `resources[i]` becomes the lane at slot `i`; the cursor is at slot 0.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param resources
   *        Lanes; may be empty.
   */
  explicit Resource_pool(flow::log::Logger* logger_ptr, std::vector<Resource>&& resources);

  /**
   * Destroys the lanes in the pool.  Behavior is undefined if anyone is still waiting in acquire(); any
   * async_acquire() handlers not yet invoked are destroyed without being invoked.
   */
  ~Resource_pool();

  // Methods.

  /**
   * Draws a ticket and blocks until the lane at its required slot is available; then takes it out of the pool.
   *
   * @return Slot and resource.  Pass both to release() when done.
   */
  Acquired acquire();

  /**
   * Draws a ticket right away, like acquire(), but does not block: `on_acquired` is invoked when the lane is
   * granted.  If that is immediately, it is invoked synchronously before this returns; otherwise later from
   * within the release() or insert() call that returns the lane.  Either way it is invoked with no lock held, so it
   * may call into the pool.
   *
   * @param on_acquired
   *        Handler.
   */
  void async_acquire(Acquire_handler&& on_acquired);

  /**
   * Returns a lane.  If a request is waiting for this slot, the earliest such request gets it now.  Otherwise it
   * goes back into the pool: if it is the lane the run needs next (the tail), it joins the run at once, together
   * with any pending ones now contiguous with it; else it is parked in the pending-return buffer.
   *
   * @param slot
   *        Slot as received from acquire() or async_acquire().
   * @param resource
   *        The resource received with it.
   * @return `true` on success; `false` (and a warning is logged, and the pool is unchanged; `resource` is not
   *         moved from) if `slot` is not currently out of the pool.
   */
  bool release(size_t slot, Resource&& resource);

  /**
   * Adds a lane as slot `L`, incrementing `L`.  It enters the rotation right after slot `L-1`.
   *
   * @param resource
   *        The new lane.
   * @return Its slot.
   */
  size_t insert(Resource&& resource);

  /**
   * Takes the lane at slot `L-1` out of the rotation and returns it, decrementing `L`; but only if that lane is
   * currently in the pool.
   *
   * @return The lane; or `nullopt` if `L` is 0 or lane `L-1` is out.
   */
  std::optional<Resource> remove();

  /**
   * `L`: the number of lanes, in or out of the pool.
   *
   * @return See above.
   */
  size_t size() const;

  /**
   * The number of lanes currently in the pool (available or pending), i.e., not held by anyone.
   *
   * @return See above.
   */
  size_t n_available() const;

private:
  // Types.

  /// A parked acquire() or async_acquire().  Exactly one of #m_granted_or_null and #m_on_acquired is set.
  struct Waiter
  {
    /// acquire(): signaled (with the pool mutex held) once #m_granted_or_null is filled.
    util::Condition_variable* m_cond_or_null;

    /// acquire(): where to put the lane.
    std::optional<Acquired>* m_granted_or_null;

    /// async_acquire(): handler.
    Acquire_handler m_on_acquired;
  }; // struct Waiter

  /// Required slot and ticket of a parked request.  Ordering puts a slot's earliest ticket first.
  using Waiter_key = std::pair<size_t, uint64_t>;

  /// A grant made for an async_acquire() handler, to be invoked once the mutex is unlocked.
  using Deferred_grant = std::pair<Acquire_handler, Acquired>;

  // Methods.

  /**
   * Whether the given slot is in the run.  #m_mutex must be locked; `m_slots.size() != 0`.
   *
   * @param slot
   *        Slot.
   * @return See above.
   */
  bool in_run(size_t slot) const;

  /**
   * Slot right after the run.  #m_mutex must be locked; `m_slots.size() != 0`.
   *
   * @return See above.
   */
  size_t tail() const;

  /**
   * Draws the next ticket, determines its required slot, and advances the cursor.  If the lane at that slot is in
   * the pool, takes it out and returns it.  #m_mutex must be locked.
   *
   * @param key
   *        Set to the required slot and ticket; under this key the caller must park itself if the lane is out.
   * @return The lane; or `nullopt` if it is out.
   */
  std::optional<Acquired> draw(Waiter_key* key);

  /**
   * If a request is parked for the given slot, grants the lane to the earliest such request: a synchronous waiter
   * is handed the lane and signaled here; an async one is appended to `deferred`.  #m_mutex must be locked.
   *
   * @param slot
   *        Slot of `resource`.
   * @param resource
   *        The lane; moved from if and only if `true` is returned.
   * @param deferred
   *        Async grants to invoke after unlocking.
   * @return Whether a request took the lane.
   */
  bool hand_off(size_t slot, Resource&& resource, std::vector<Deferred_grant>* deferred);

  /**
   * Moves lanes from #m_pending into the run while one of them is at the tail.  #m_mutex must be locked.
   */
  void absorb_pending();

  /**
   * Invokes the given grants' handlers.  #m_mutex must not be locked.
   *
   * @param deferred
   *        Grants.
   */
  static void invoke_deferred(std::vector<Deferred_grant>* deferred);

  // Data.

  /// Protects all data below.
  mutable util::Mutex_non_recursive m_mutex;

  /// Lane at each slot if it is in the run; `nullopt` if out or pending.  `m_slots.size()` is `L`.
  std::vector<std::optional<Resource>> m_slots;

  /// Pending-return buffer: lanes returned but not yet contiguous with the run.  Never contains the tail.
  std::map<size_t, Resource> m_pending;

  /// Required slot of the next ticket; also the front of the run.  In `[0, L)` if `L != 0`, else 0.
  size_t m_cursor;

  /// Length of the run.
  size_t m_run_len;

  /// Ticket to be drawn next.
  uint64_t m_next_ticket;

  /// Parked requests.  A slot with a parked request is never in the pool: its lane is out.
  std::map<Waiter_key, Waiter> m_waiters;
}; // class Resource_pool

// Template implementations.

/// Internally used macro; public API users should disregard.
#define TEMPLATE_RESOURCE_POOL \
  template<typename Resource>
/// Internally used macro; public API users should disregard.
#define CLASS_RESOURCE_POOL \
  Resource_pool<Resource>

TEMPLATE_RESOURCE_POOL
CLASS_RESOURCE_POOL::Resource_pool(flow::log::Logger* logger_ptr, std::vector<Resource>&& resources) :
  flow::log::Log_context(logger_ptr, Log_component::S_POOL),
  m_cursor(0),
  m_run_len(resources.size()),
  m_next_ticket(0)
{
  m_slots.reserve(resources.size());
  for (auto& resource : resources)
  {
    m_slots.emplace_back(std::move(resource));
  }
  resources.clear();

  FLOW_LOG_INFO("Resource_pool [" << *this << "]: Created with [" << m_slots.size() << "] lanes.");
}

TEMPLATE_RESOURCE_POOL
CLASS_RESOURCE_POOL::~Resource_pool()
{
  FLOW_LOG_INFO("Resource_pool [" << *this << "]: Shutting down.  Lanes: [" << m_slots.size() << "]; "
                "in pool [" << n_available() << "]; tickets drawn [" << m_next_ticket << "].");
  if (!m_waiters.empty())
  {
    FLOW_LOG_WARNING("Resource_pool [" << *this << "]: [" << m_waiters.size() << "] acquirers still waiting at "
                     "destruction; their requests are dropped.");
  }
}

TEMPLATE_RESOURCE_POOL
typename CLASS_RESOURCE_POOL::Acquired CLASS_RESOURCE_POOL::acquire()
{
  util::Lock_guard_non_recursive lock(m_mutex);

  Waiter_key key;
  auto acquired = draw(&key);
  if (acquired)
  {
    FLOW_LOG_TRACE("Resource_pool [" << *this << "]: Ticket [" << key.second << "] granted slot "
                   "[" << key.first << "] immediately.");
    return std::move(*acquired);
  }
  // else
  FLOW_LOG_TRACE("Resource_pool [" << *this << "]: Ticket [" << key.second << "] must wait for slot "
                 "[" << key.first << "] to be returned.");

  util::Condition_variable cond;
  std::optional<Acquired> granted;
  m_waiters.emplace(key, Waiter{ &cond, &granted, Acquire_handler() });
  cond.wait(lock, [&]() -> bool { return granted.has_value(); });

  return std::move(*granted);
} // Resource_pool::acquire()

TEMPLATE_RESOURCE_POOL
void CLASS_RESOURCE_POOL::async_acquire(Acquire_handler&& on_acquired)
{
  std::vector<Deferred_grant> deferred;
  {
    util::Lock_guard_non_recursive lock(m_mutex);

    Waiter_key key;
    auto acquired = draw(&key);
    if (acquired)
    {
      FLOW_LOG_TRACE("Resource_pool [" << *this << "]: Ticket [" << key.second << "] (async) granted slot "
                     "[" << key.first << "] immediately.");
      deferred.emplace_back(std::move(on_acquired), std::move(*acquired));
    }
    else
    {
      FLOW_LOG_TRACE("Resource_pool [" << *this << "]: Ticket [" << key.second << "] (async) must wait for slot "
                     "[" << key.first << "] to be returned.");
      m_waiters.emplace(key, Waiter{ nullptr, nullptr, std::move(on_acquired) });
    }
  }

  invoke_deferred(&deferred);
} // Resource_pool::async_acquire()

TEMPLATE_RESOURCE_POOL
bool CLASS_RESOURCE_POOL::release(size_t slot, Resource&& resource)
{
  std::vector<Deferred_grant> deferred;
  {
    util::Lock_guard_non_recursive lock(m_mutex);

    if ((slot >= m_slots.size()) || m_slots[slot] || (m_pending.count(slot) != 0))
    {
      FLOW_LOG_WARNING("Resource_pool [" << *this << "]: Release of slot [" << slot << "] ignored: it is out of "
                       "range [0, " << m_slots.size() << ") or not checked out.");
      return false;
    }
    // else

    // If someone is waiting for it, the lane goes straight to them; the run and the tail are unaffected.
    if (!hand_off(slot, std::move(resource), &deferred))
    {
      if (slot == tail())
      {
        m_slots[slot].emplace(std::move(resource));
        ++m_run_len;
        absorb_pending();
        FLOW_LOG_TRACE("Resource_pool [" << *this << "]: Slot [" << slot << "] released at the tail; lanes in "
                       "run now [" << m_run_len << "]; pending [" << m_pending.size() << "].");
      }
      else
      {
        m_pending.emplace(slot, std::move(resource));
        FLOW_LOG_TRACE("Resource_pool [" << *this << "]: Slot [" << slot << "] released out of order (tail is "
                       "[" << tail() << "]); pending [" << m_pending.size() << "].");
      }
    }
  }

  invoke_deferred(&deferred);
  return true;
} // Resource_pool::release()

TEMPLATE_RESOURCE_POOL
size_t CLASS_RESOURCE_POOL::insert(Resource&& resource)
{
  std::vector<Deferred_grant> deferred;
  size_t slot;
  {
    util::Lock_guard_non_recursive lock(m_mutex);

    slot = m_slots.size();
    // The new slot sits between slot L-1 and slot 0; it can join the run only if the run reaches slot L-1.
    const bool joins_run = (slot == 0) || in_run(slot - 1);

    m_slots.emplace_back();
    // Only requests drawn while L was 0 can be parked on the new slot (slot 0).
    const bool handed_off = hand_off(slot, std::move(resource), &deferred);
    if (!handed_off)
    {
      if (joins_run)
      {
        m_slots.back().emplace(std::move(resource));
        ++m_run_len;
        absorb_pending();
      }
      else
      {
        m_pending.emplace(slot, std::move(resource));
      }
    }

    FLOW_LOG_INFO("Resource_pool [" << *this << "]: Inserted lane at slot [" << slot << "] "
                  "(" << (handed_off ? "granted" : (joins_run ? "available" : "pending")) << "); lanes now "
                  "[" << m_slots.size() << "].");
  }

  invoke_deferred(&deferred);
  return slot;
} // Resource_pool::insert()

TEMPLATE_RESOURCE_POOL
std::optional<Resource> CLASS_RESOURCE_POOL::remove()
{
  std::optional<Resource> removed;
  util::Lock_guard_non_recursive lock(m_mutex);

  if (m_slots.empty())
  {
    FLOW_LOG_INFO("Resource_pool [" << *this << "]: Remove requested, but there are no lanes.");
    return std::nullopt;
  }
  // else

  const size_t slot = m_slots.size() - 1;
  if (m_slots[slot])
  {
    removed.emplace(std::move(*m_slots[slot]));
    --m_run_len;
  }
  else
  {
    const auto pending_it = m_pending.find(slot);
    if (pending_it == m_pending.end())
    {
      FLOW_LOG_INFO("Resource_pool [" << *this << "]: Remove requested, but the newest lane (slot "
                    "[" << slot << "]) is checked out.");
      return std::nullopt;
    }
    // else
    removed.emplace(std::move(pending_it->second));
    m_pending.erase(pending_it);
  }

  if (m_cursor == slot)
  {
    // The run continued (if at all) with slot 0.
    m_cursor = 0;
  }
  m_slots.pop_back();
  if (!m_slots.empty())
  {
    absorb_pending();
  }

  FLOW_LOG_INFO("Resource_pool [" << *this << "]: Removed lane at slot [" << slot << "]; lanes now "
                "[" << m_slots.size() << "].");
  return removed;
} // Resource_pool::remove()

TEMPLATE_RESOURCE_POOL
size_t CLASS_RESOURCE_POOL::size() const
{
  util::Lock_guard_non_recursive lock(m_mutex);
  return m_slots.size();
}

TEMPLATE_RESOURCE_POOL
size_t CLASS_RESOURCE_POOL::n_available() const
{
  util::Lock_guard_non_recursive lock(m_mutex);
  return m_run_len + m_pending.size();
}

TEMPLATE_RESOURCE_POOL
bool CLASS_RESOURCE_POOL::in_run(size_t slot) const
{
  const size_t n_slots = m_slots.size();
  return ((slot + n_slots - m_cursor) % n_slots) < m_run_len;
}

TEMPLATE_RESOURCE_POOL
size_t CLASS_RESOURCE_POOL::tail() const
{
  return (m_cursor + m_run_len) % m_slots.size();
}

TEMPLATE_RESOURCE_POOL
std::optional<typename CLASS_RESOURCE_POOL::Acquired> CLASS_RESOURCE_POOL::draw(Waiter_key* key)
{
  const size_t slot = m_cursor;
  *key = Waiter_key(slot, m_next_ticket++);

  if (m_slots.empty())
  {
    return std::nullopt; // Everyone waits for slot 0.
  }
  // else

  m_cursor = (m_cursor + 1) % m_slots.size();
  if (m_run_len == 0)
  {
    /* The cursor's lane is out (it cannot be pending, as with an empty run the cursor is the tail).  The tail
     * moves with the cursor, possibly onto a pending lane. */
    absorb_pending();
    return std::nullopt;
  }
  // else

  std::optional<Acquired> acquired;
  acquired.emplace(slot, std::move(*m_slots[slot]));
  m_slots[slot].reset();
  --m_run_len;
  return acquired;
} // Resource_pool::draw()

TEMPLATE_RESOURCE_POOL
bool CLASS_RESOURCE_POOL::hand_off(size_t slot, Resource&& resource, std::vector<Deferred_grant>* deferred)
{
  const auto waiter_it = m_waiters.lower_bound(Waiter_key(slot, 0));
  if ((waiter_it == m_waiters.end()) || (waiter_it->first.first != slot))
  {
    return false;
  }
  // else

  auto& waiter = waiter_it->second;
  FLOW_LOG_TRACE("Resource_pool [" << *this << "]: Ticket [" << waiter_it->first.second << "] granted slot "
                 "[" << slot << "] after waiting.");

  Acquired acquired(slot, std::move(resource));
  if (waiter.m_granted_or_null)
  {
    // Signal with the lock held: the waiter (and its condition variable) cannot go away before we unlock.
    waiter.m_granted_or_null->emplace(std::move(acquired));
    waiter.m_cond_or_null->notify_one();
  }
  else
  {
    deferred->emplace_back(std::move(waiter.m_on_acquired), std::move(acquired));
  }
  m_waiters.erase(waiter_it);
  return true;
} // Resource_pool::hand_off()

TEMPLATE_RESOURCE_POOL
void CLASS_RESOURCE_POOL::absorb_pending()
{
  while ((!m_pending.empty()) && (m_run_len != m_slots.size()))
  {
    const auto pending_it = m_pending.find(tail());
    if (pending_it == m_pending.end())
    {
      return;
    }
    // else
    m_slots[pending_it->first].emplace(std::move(pending_it->second));
    m_pending.erase(pending_it);
    ++m_run_len;
  }
}

TEMPLATE_RESOURCE_POOL
void CLASS_RESOURCE_POOL::invoke_deferred(std::vector<Deferred_grant>* deferred) // Static.
{
  for (auto& grant : *deferred)
  {
    grant.first(grant.second.first, std::move(grant.second.second));
  }
}

TEMPLATE_RESOURCE_POOL
std::ostream& operator<<(std::ostream& os, const CLASS_RESOURCE_POOL& val)
{
  return os << '@' << &val;
}

#undef CLASS_RESOURCE_POOL
#undef TEMPLATE_RESOURCE_POOL

} // namespace mpcnet::pool
