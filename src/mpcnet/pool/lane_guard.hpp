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

#include "mpcnet/pool/resource_pool.hpp"
#include <cassert>

namespace mpcnet::pool
{

// Types.

/**
 * Scoped holder of one lane of a Resource_pool: acquires (or adopts) it on construction, releases it on
 * destruction, so that an exception cannot leave the lane out of the pool (which would stall the rotation).
 *
 * Movable (the lane goes with it) but not copyable.  Not thread-safe: one thread at a time may use a given
 * Lane_guard.
 *
 * @tparam Resource
 *         See Resource_pool.
 */
template<typename Resource>
class Lane_guard
{
public:
  // Types.

  /// Short-hand for the pool type.
  using Pool = Resource_pool<Resource>;

  // Constructors/destructor.

  /**
   * Acquires a lane from the given pool, blocking as described in Resource_pool::acquire().
   *
   * @param pool
   *        Pool; must outlive `*this`.
   */
  explicit Lane_guard(Pool* pool);

  /**
   * Takes ownership of a lane granted by the given pool via Resource_pool::async_acquire().
   *
   * @param pool
   *        Pool that granted it; must outlive `*this`.
   * @param slot
   *        Granted slot.
   * @param resource
   *        Granted resource.
   */
  explicit Lane_guard(Pool* pool, size_t slot, Resource&& resource);

  /**
   * Takes over the lane (if any) held by `src`, which becomes empty.
   *
   * @param src
   *        Moved-from object.
   */
  Lane_guard(Lane_guard&& src);

  /// Releases the lane, if still held.
  ~Lane_guard();

  // Methods.

  /**
   * Releases the lane held by `*this` (if any); then takes over the one (if any) held by `src`.
   *
   * @param src
   *        Moved-from object.
   * @return `*this`.
   */
  Lane_guard& operator=(Lane_guard&& src);

  /**
   * Returns the lane to the pool now.  No-op if not held.
   */
  void release();

  /**
   * Whether a lane is held.
   *
   * @return See above.
   */
  bool holds() const;

  /**
   * Slot of the held lane.  Behavior undefined if not holds().
   *
   * @return See above.
   */
  size_t slot() const;

  /**
   * The held lane.  Behavior undefined if not holds().
   *
   * @return See above.
   */
  Resource& resource();

  /**
   * The held lane.  Behavior undefined if not holds().
   *
   * @return See above.
   */
  const Resource& resource() const;

  /**
   * Same as resource().
   *
   * @return See above.
   */
  Resource& operator*();

  /**
   * Same as `&resource()`.
   *
   * @return See above.
   */
  Resource* operator->();

private:
  // Data.

  /// See constructor.  Null after move-from.
  Pool* m_pool;

  /// See slot().
  size_t m_slot;

  /// See resource(); `nullopt` if not holds().
  std::optional<Resource> m_resource;
}; // class Lane_guard

// Template implementations.

template<typename Resource>
Lane_guard<Resource>::Lane_guard(Pool* pool) :
  m_pool(pool),
  m_slot(0)
{
  auto acquired = m_pool->acquire();
  m_slot = acquired.first;
  m_resource.emplace(std::move(acquired.second));
}

template<typename Resource>
Lane_guard<Resource>::Lane_guard(Pool* pool, size_t slot, Resource&& resource) :
  m_pool(pool),
  m_slot(slot),
  m_resource(std::move(resource))
{
  // That's it.
}

template<typename Resource>
Lane_guard<Resource>::Lane_guard(Lane_guard&& src) :
  m_pool(src.m_pool),
  m_slot(src.m_slot),
  m_resource(std::move(src.m_resource))
{
  src.m_resource.reset();
}

template<typename Resource>
Lane_guard<Resource>::~Lane_guard()
{
  release();
}

template<typename Resource>
Lane_guard<Resource>& Lane_guard<Resource>::operator=(Lane_guard&& src)
{
  if (&src != this)
  {
    release();
    m_pool = src.m_pool;
    m_slot = src.m_slot;
    m_resource = std::move(src.m_resource);
    src.m_resource.reset();
  }
  return *this;
}

template<typename Resource>
void Lane_guard<Resource>::release()
{
  if (!m_resource)
  {
    return;
  }
  // else

  // The slot came from the pool and has not been returned since, so the pool will take it.
#ifndef NDEBUG
  const bool ok =
#endif
  m_pool->release(m_slot, std::move(*m_resource));
  assert(ok);
  m_resource.reset();
}

template<typename Resource>
bool Lane_guard<Resource>::holds() const
{
  return m_resource.has_value();
}

template<typename Resource>
size_t Lane_guard<Resource>::slot() const
{
  assert(holds());
  return m_slot;
}

template<typename Resource>
Resource& Lane_guard<Resource>::resource()
{
  assert(holds());
  return *m_resource;
}

template<typename Resource>
const Resource& Lane_guard<Resource>::resource() const
{
  assert(holds());
  return *m_resource;
}

template<typename Resource>
Resource& Lane_guard<Resource>::operator*()
{
  return resource();
}

template<typename Resource>
Resource* Lane_guard<Resource>::operator->()
{
  return &(resource());
}

} // namespace mpcnet::pool
