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

#include "mpcnet/engine/handle.hpp"
#include "mpcnet/engine/detail/fork_join.hpp"
#include "mpcnet/pool/lane_guard.hpp"
#include <flow/async/x_thread_task_loop.hpp>
#include <flow/util/util.hpp>
#include <optional>
#include <atomic>
#include <memory>
#include <tuple>
#include <utility>
#include <vector>

namespace mpcnet::engine
{

// Types.

/**
 * Runs the steps of an MPC protocol on 2 thread pools: the *network* pool, for steps that talk to the other
 * parties, each of which gets a transport lane of its own for its duration; and the *compute* pool, for local
 * number crunching.  The lanes come from an internal pool::Resource_pool, so that concurrent steps never share a
 * lane, and (since the pool hands out lanes in strict rotation) so that every party uses the same lane for the
 * same step provided all parties issue their steps in the same order.
 *
 * ### Ways to run a closure ###
 *   - spawn_net() and spawn_cpu(): fire and forget; the closure runs on a pool thread; its Task_outcome
 *     arrives via a Handle.  Never blocks the caller; for spawn_net() the lane is claimed in the rotation (a
 *     ticket drawn) right away and granted once that lane is free.
 *   - install_net() and install_cpu(): run the closure on the pool and wait for it; return its result or throw
 *     its exception.  install_net() acquires the lane on the calling thread first.  Called from a thread of the
 *     same pool, the closure simply runs inline.
 *   - join_net() and join_cpu(): fork-join of 2 to 8 (network) or 2 to 5 (compute) closures: all run
 *     concurrently on the pool; the call returns a tuple of their results in argument order.  join_net()
 *     acquires one lane per closure, in argument order, on the calling thread; they are all released once every
 *     closure has finished, even if some threw.  If any closure threw, the first such exception in argument order
 *     is rethrown (after all have finished).
 *
 * A closure for the network pool is invoked as `func(Transport_obj& lane)`; one for the compute pool as `func()`.
 * A closure returning `void` yields Void_result.
 *
 * ### Threads ###
 * The pools are `flow::async::Cross_thread_task_loop`s, started in the constructor and stopped in the destructor.
 * By default the network pool has #S_N_THREADS_NET threads, and the compute pool a count chosen by Flow from
 * the hardware.  Network closures typically block on I/O, hence the fixed, generous network pool size.
 *
 * All public methods may be called concurrently from any threads, including from closures running on either pool.
 *
 * @tparam Transport_obj
 *         Lane type: see the Transport concept in transport_fwd.hpp.  Only needs to be movable as far as this
 *         class is concerned.
 */
template<typename Transport_obj>
class Dual_pool_engine :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Types.

  /// Short-hand for template parameter.
  using Transport = Transport_obj;

  /// The lane pool type.
  using Pool = pool::Resource_pool<Transport_obj>;

  /// The scoped-lane type.
  using Lane = pool::Lane_guard<Transport_obj>;

  // Constants.

  /// Default network pool thread count.
  static constexpr size_t S_N_THREADS_NET = 8;

  /// Default compute pool thread count: 0 means Flow picks it based on the hardware.
  static constexpr size_t S_N_THREADS_CPU = 0;

  /// Max closure count for join_net().
  static constexpr size_t S_MAX_JOIN_NET = 8;

  /// Max closure count for join_cpu().
  static constexpr size_t S_MAX_JOIN_CPU = 5;

  // Constructors/destructor.

  /**
   * Takes ownership of the lanes and starts both pools.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param id
   *        Identifier of this engine, such as this party's ID; see id().
   * @param n_threads_net
   *        Network pool thread count; 0 means Flow picks it.
   * @param n_threads_cpu
   *        Compute pool thread count; 0 means Flow picks it.
   * @param lanes
   *        The lanes; slot `i` is `lanes[i]`.  Should be non-empty if `*_net()` will be used.
   */
  explicit Dual_pool_engine(flow::log::Logger* logger_ptr, size_t id, size_t n_threads_net, size_t n_threads_cpu,
                            std::vector<Transport_obj>&& lanes);

  /**
   * Same as the other constructor with #S_N_THREADS_NET and #S_N_THREADS_CPU.
   *
   * @param logger_ptr
   *        See other constructor.
   * @param id
   *        See other constructor.
   * @param lanes
   *        See other constructor.
   */
  explicit Dual_pool_engine(flow::log::Logger* logger_ptr, size_t id, std::vector<Transport_obj>&& lanes);

  /**
   * Stops both pools, waiting for running closures to finish.  Closures spawned but not yet started never run;
   * their Handle reports a failed outcome; their lanes return to the pool.
   */
  ~Dual_pool_engine();

  // Methods.

  /**
   * The ID given to the constructor.
   *
   * @return See above.
   */
  size_t id() const;

  /**
   * Network pool thread count.
   *
   * @return See above.
   */
  size_t n_threads_net() const;

  /**
   * Compute pool thread count.
   *
   * @return See above.
   */
  size_t n_threads_cpu() const;

  /**
   * The lane pool; e.g., to insert() or remove() lanes, or to observe it.
   *
   * @return See above.
   */
  Pool* lane_pool();

  /**
   * Runs `func(lane)` on the network pool with a lane of its own; does not block.  The lane is requested from the
   * pool now (so the order of spawn_net() calls determines the order of lanes) and returned right after `func`
   * returns or throws.
   *
   * @tparam Func
   *         Closure type: callable as `R (Transport_obj&)`; copy- or move-constructible.
   * @param func
   *        Closure.
   * @return Handle to the outcome.
   */
  template<typename Func>
  Handle<detail::Result_of_t<Func, Transport_obj>> spawn_net(Func&& func);

  /**
   * Runs `func()` on the compute pool; does not block.
   *
   * @tparam Func
   *         Closure type: callable as `R ()`.
   * @param func
   *        Closure.
   * @return Handle to the outcome.
   */
  template<typename Func>
  Handle<detail::Result_of_t<Func>> spawn_cpu(Func&& func);

  /**
   * Acquires a lane (blocking until its turn), runs `func(lane)` on the network pool, waits for it, and releases
   * the lane.
   *
   * @tparam Func
   *         Closure type: callable as `R (Transport_obj&)`.
   * @param func
   *        Closure.
   * @return What `func` returned.  If it threw, the exception propagates instead.
   */
  template<typename Func>
  detail::Result_of_t<Func, Transport_obj> install_net(Func&& func);

  /**
   * Runs `func()` on the compute pool and waits for it.
   *
   * @tparam Func
   *         Closure type: callable as `R ()`.
   * @param func
   *        Closure.
   * @return What `func` returned.  If it threw, the exception propagates instead.
   */
  template<typename Func>
  detail::Result_of_t<Func> install_cpu(Func&& func);

  /**
   * Acquires `K = sizeof...(funcs)` lanes in argument order (blocking until each one's turn), runs
   * `funcs[i](lane i)` concurrently on the network pool, waits for all, and releases the lanes.
   *
   * @tparam Funcs
   *         Closure types, 2 to #S_MAX_JOIN_NET of them: each callable as `R_i (Transport_obj&)`.
   * @param funcs
   *        Closures.
   * @return `R_i` values, in argument order.  If any closure threw, the first such exception in argument order
   *         propagates instead.
   */
  template<typename... Funcs>
  std::tuple<detail::Result_of_t<Funcs, Transport_obj>...> join_net(Funcs&&... funcs);

  /**
   * Runs `funcs[i]()` concurrently on the compute pool and waits for all.
   *
   * @tparam Funcs
   *         Closure types, 2 to #S_MAX_JOIN_CPU of them: each callable as `R_i ()`.
   * @param funcs
   *        Closures.
   * @return `R_i` values, in argument order.  If any closure threw, the first such exception in argument order
   *         propagates instead.
   */
  template<typename... Funcs>
  std::tuple<detail::Result_of_t<Funcs>...> join_cpu(Funcs&&... funcs);

private:
  // Types.

  /// Short-hand for the thread pool type.
  using Loop = flow::async::Cross_thread_task_loop;

  // Methods.

  /**
   * Starts the given pool, marking each of its threads as belonging to it (see detail::this_thread_pool()).
   *
   * @param loop
   *        Pool.
   */
  void start_loop(Loop* loop);

  /**
   * Runs `body()` on the given pool, inline if the caller is one of its threads, and waits for it.
   *
   * @tparam Result
   *         See Task_outcome.
   * @tparam Body
   *         Callable as `Task_outcome<Result> ()`; must not throw.
   * @param loop
   *        Pool.
   * @param body
   *        What to run.
   * @return What `body()` returned.
   */
  template<typename Result, typename Body>
  Task_outcome<Result> run_on(Loop* loop, Body&& body);

  /**
   * Runs the given work items on the given pool via detail::fork_join().
   *
   * @param loop
   *        Pool.
   * @param thunks
   *        Work items; each must not throw.
   */
  void fork_join_on(Loop* loop, std::vector<flow::async::Task>* thunks);

  /**
   * Makes the work item for closure `Idx` of join_net().
   *
   * @tparam Idx
   *         Closure index.
   * @tparam Outcomes
   *         `tuple` of `optional<Task_outcome<R_i>>`.
   * @tparam Func_refs
   *         `tuple` of references to the closures.
   * @param outcomes
   *        Where to put the outcome.
   * @param funcs
   *        The closures.
   * @param lanes
   *        The lanes, in closure order.
   * @return See above.
   */
  template<size_t Idx, typename Outcomes, typename Func_refs>
  static flow::async::Task net_thunk(Outcomes* outcomes, Func_refs* funcs, std::vector<Lane>* lanes);

  /**
   * Makes the work item for closure `Idx` of join_cpu().
   *
   * @tparam Idx
   *         Closure index.
   * @tparam Outcomes
   *         `tuple` of `optional<Task_outcome<R_i>>`.
   * @tparam Func_refs
   *         `tuple` of references to the closures.
   * @param outcomes
   *        Where to put the outcome.
   * @param funcs
   *        The closures.
   * @return See above.
   */
  template<size_t Idx, typename Outcomes, typename Func_refs>
  static flow::async::Task cpu_thunk(Outcomes* outcomes, Func_refs* funcs);

  /**
   * net_thunk() for each closure.
   *
   * @tparam Outcomes
   *         See net_thunk().
   * @tparam Func_refs
   *         See net_thunk().
   * @tparam Idx
   *         `0, 1, ...`.
   * @param outcomes
   *        See net_thunk().
   * @param funcs
   *        See net_thunk().
   * @param lanes
   *        See net_thunk().
   * @return See above.
   */
  template<typename Outcomes, typename Func_refs, size_t... Idx>
  static std::vector<flow::async::Task> make_net_thunks(Outcomes* outcomes, Func_refs* funcs,
                                                        std::vector<Lane>* lanes, std::index_sequence<Idx...>);

  /**
   * cpu_thunk() for each closure.
   *
   * @tparam Outcomes
   *         See cpu_thunk().
   * @tparam Func_refs
   *         See cpu_thunk().
   * @tparam Idx
   *         `0, 1, ...`.
   * @param outcomes
   *        See cpu_thunk().
   * @param funcs
   *        See cpu_thunk().
   * @return See above.
   */
  template<typename Outcomes, typename Func_refs, size_t... Idx>
  static std::vector<flow::async::Task> make_cpu_thunks(Outcomes* outcomes, Func_refs* funcs,
                                                        std::index_sequence<Idx...>);

  /**
   * Rethrows the first failure among the given outcomes, if any; else moves out their values.
   *
   * @tparam Results
   *         `R_i`.
   * @tparam Idx
   *         `0, 1, ...`.
   * @param outcomes
   *        All set.
   * @return See above.
   */
  template<typename... Results, size_t... Idx>
  static std::tuple<Results...> collect(std::tuple<std::optional<Task_outcome<Results>>...>* outcomes,
                                        std::index_sequence<Idx...>);

  // Data.

  /// The lanes.  Declared before the pools so that it outlives any task still holding a lane.
  Pool m_pool;

  /// See id().
  const size_t m_id;

  /// Set at the start of destruction; from then on lanes granted to spawn_net() requests are not posted.
  std::atomic<bool> m_stopping;

  /// The network pool.
  std::unique_ptr<Loop> m_net_loop;

  /// The compute pool.
  std::unique_ptr<Loop> m_cpu_loop;
}; // class Dual_pool_engine

// Template implementations.

/// Internally used macro; public API users should disregard.
#define TEMPLATE_DUAL_POOL_ENGINE \
  template<typename Transport_obj>
/// Internally used macro; public API users should disregard.
#define CLASS_DUAL_POOL_ENGINE \
  Dual_pool_engine<Transport_obj>

TEMPLATE_DUAL_POOL_ENGINE
CLASS_DUAL_POOL_ENGINE::Dual_pool_engine(flow::log::Logger* logger_ptr, size_t id,
                                         size_t n_threads_net, size_t n_threads_cpu,
                                         std::vector<Transport_obj>&& lanes) :
  flow::log::Log_context(logger_ptr, Log_component::S_ENGINE),
  m_pool(logger_ptr, std::move(lanes)),
  m_id(id),
  m_stopping(false),
  m_net_loop(std::make_unique<Loop>(logger_ptr, flow::util::ostream_op_string("mpc_net-", id), n_threads_net)),
  m_cpu_loop(std::make_unique<Loop>(logger_ptr, flow::util::ostream_op_string("mpc_cpu-", id), n_threads_cpu))
{
  start_loop(m_net_loop.get());
  start_loop(m_cpu_loop.get());

  FLOW_LOG_INFO("Dual_pool_engine [" << *this << "]: Started with [" << m_pool.size() << "] lanes; network pool "
                "threads [" << m_net_loop->n_threads() << "]; compute pool threads [" << m_cpu_loop->n_threads() << "].");
}

TEMPLATE_DUAL_POOL_ENGINE
CLASS_DUAL_POOL_ENGINE::Dual_pool_engine(flow::log::Logger* logger_ptr, size_t id,
                                         std::vector<Transport_obj>&& lanes) :
  Dual_pool_engine(logger_ptr, id, S_N_THREADS_NET, S_N_THREADS_CPU, std::move(lanes))
{
  // Delegated.
}

TEMPLATE_DUAL_POOL_ENGINE
CLASS_DUAL_POOL_ENGINE::~Dual_pool_engine()
{
  FLOW_LOG_INFO("Dual_pool_engine [" << *this << "]: Shutting down: stopping both pools.");

  m_stopping = true;
  /* Stop both before destroying either: a closure finishing on one pool may still hand a lane to a spawn_net()
   * request, which posts onto the network pool.  After stop() no thread of either pool runs, so only our
   * thread touches them below. */
  m_cpu_loop->stop();
  m_net_loop->stop();
  m_cpu_loop.reset();
  m_net_loop.reset(); // Unrun tasks die here; their lanes go back to m_pool; their Handles see a broken promise.
}

TEMPLATE_DUAL_POOL_ENGINE
size_t CLASS_DUAL_POOL_ENGINE::id() const
{
  return m_id;
}

TEMPLATE_DUAL_POOL_ENGINE
size_t CLASS_DUAL_POOL_ENGINE::n_threads_net() const
{
  return m_net_loop->n_threads();
}

TEMPLATE_DUAL_POOL_ENGINE
size_t CLASS_DUAL_POOL_ENGINE::n_threads_cpu() const
{
  return m_cpu_loop->n_threads();
}

TEMPLATE_DUAL_POOL_ENGINE
typename CLASS_DUAL_POOL_ENGINE::Pool* CLASS_DUAL_POOL_ENGINE::lane_pool()
{
  return &m_pool;
}

TEMPLATE_DUAL_POOL_ENGINE
void CLASS_DUAL_POOL_ENGINE::start_loop(Loop* loop)
{
  loop->start(flow::async::Task(), [loop](size_t)
  {
    detail::set_this_thread_pool(loop);
  });
}

TEMPLATE_DUAL_POOL_ENGINE
template<typename Func>
Handle<detail::Result_of_t<Func, Transport_obj>> CLASS_DUAL_POOL_ENGINE::spawn_net(Func&& func)
{
  using Result = detail::Result_of_t<Func, Transport_obj>;
  using Outcome = Task_outcome<Result>;
  using std::make_shared;

  // Flow tasks must be copyable; so keep the state behind shared_ptr<>s.
  auto promise = make_shared<boost::promise<Outcome>>();
  auto func_ptr = make_shared<std::decay_t<Func>>(std::forward<Func>(func));
  Handle<Result> handle(promise->get_future());

  FLOW_LOG_TRACE("Dual_pool_engine [" << *this << "]: spawn_net(): Requesting lane.");

  m_pool.async_acquire([this, promise, func_ptr](size_t slot, Transport_obj&& resource)
  {
    // We are in the spawning thread, or in whichever thread released the lane we were waiting for.
    auto lane = make_shared<Lane>(&m_pool, slot, std::move(resource));
    if (m_stopping)
    {
      return; // Lane goes back; promise is broken.
    }
    // else

    m_net_loop->post([this, promise, func_ptr, lane]()
    {
      FLOW_LOG_TRACE("Dual_pool_engine [" << *this << "]: spawn_net() closure starting on lane "
                     "[" << lane->slot() << "].");
      auto outcome = detail::invoke_capturing<Result>(*func_ptr, lane->resource());
      // Lane first, so that it is back by the time the joiner learns of completion.
      lane->release();
      promise->set_value(std::move(outcome));
    });
  });

  return handle;
} // Dual_pool_engine::spawn_net()

TEMPLATE_DUAL_POOL_ENGINE
template<typename Func>
Handle<detail::Result_of_t<Func>> CLASS_DUAL_POOL_ENGINE::spawn_cpu(Func&& func)
{
  using Result = detail::Result_of_t<Func>;
  using Outcome = Task_outcome<Result>;
  using std::make_shared;

  auto promise = make_shared<boost::promise<Outcome>>();
  auto func_ptr = make_shared<std::decay_t<Func>>(std::forward<Func>(func));
  Handle<Result> handle(promise->get_future());

  m_cpu_loop->post([promise, func_ptr]()
  {
    promise->set_value(detail::invoke_capturing<Result>(*func_ptr));
  });

  return handle;
}

TEMPLATE_DUAL_POOL_ENGINE
template<typename Func>
detail::Result_of_t<Func, Transport_obj> CLASS_DUAL_POOL_ENGINE::install_net(Func&& func)
{
  using Result = detail::Result_of_t<Func, Transport_obj>;

  Lane lane(&m_pool);
  FLOW_LOG_TRACE("Dual_pool_engine [" << *this << "]: install_net(): Got lane [" << lane.slot() << "].");

  auto outcome = run_on<Result>(m_net_loop.get(), [&]() -> Task_outcome<Result>
  {
    return detail::invoke_capturing<Result>(func, lane.resource());
  });
  lane.release();

  return std::move(outcome.value());
}

TEMPLATE_DUAL_POOL_ENGINE
template<typename Func>
detail::Result_of_t<Func> CLASS_DUAL_POOL_ENGINE::install_cpu(Func&& func)
{
  using Result = detail::Result_of_t<Func>;

  auto outcome = run_on<Result>(m_cpu_loop.get(), [&]() -> Task_outcome<Result>
  {
    return detail::invoke_capturing<Result>(func);
  });
  return std::move(outcome.value());
}

TEMPLATE_DUAL_POOL_ENGINE
template<typename... Funcs>
std::tuple<detail::Result_of_t<Funcs, Transport_obj>...> CLASS_DUAL_POOL_ENGINE::join_net(Funcs&&... funcs)
{
  constexpr size_t K = sizeof...(Funcs);
  static_assert((K >= 2) && (K <= S_MAX_JOIN_NET), "join_net() takes 2 to 8 closures.");

  std::vector<Lane> lanes;
  lanes.reserve(K);
  for (size_t idx = 0; idx != K; ++idx)
  {
    lanes.emplace_back(&m_pool);
  }
  FLOW_LOG_TRACE("Dual_pool_engine [" << *this << "]: join_net(): Got [" << K << "] lanes starting with slot "
                 "[" << lanes.front().slot() << "].");

  std::tuple<std::optional<Task_outcome<detail::Result_of_t<Funcs, Transport_obj>>>...> outcomes;
  auto func_refs = std::forward_as_tuple(funcs...);
  std::vector<flow::async::Task> thunks
    = make_net_thunks(&outcomes, &func_refs, &lanes, std::make_index_sequence<K>());

  fork_join_on(m_net_loop.get(), &thunks);
  lanes.clear(); // All closures are done: return the lanes before reporting.

  return collect(&outcomes, std::make_index_sequence<K>());
}

TEMPLATE_DUAL_POOL_ENGINE
template<typename... Funcs>
std::tuple<detail::Result_of_t<Funcs>...> CLASS_DUAL_POOL_ENGINE::join_cpu(Funcs&&... funcs)
{
  constexpr size_t K = sizeof...(Funcs);
  static_assert((K >= 2) && (K <= S_MAX_JOIN_CPU), "join_cpu() takes 2 to 5 closures.");

  std::tuple<std::optional<Task_outcome<detail::Result_of_t<Funcs>>>...> outcomes;
  auto func_refs = std::forward_as_tuple(funcs...);
  std::vector<flow::async::Task> thunks
    = make_cpu_thunks(&outcomes, &func_refs, std::make_index_sequence<K>());

  fork_join_on(m_cpu_loop.get(), &thunks);

  return collect(&outcomes, std::make_index_sequence<K>());
}

TEMPLATE_DUAL_POOL_ENGINE
template<typename Result, typename Body>
Task_outcome<Result> CLASS_DUAL_POOL_ENGINE::run_on(Loop* loop, Body&& body)
{
  if (detail::this_thread_pool() == loop)
  {
    // Posting and waiting would tie up this thread for nothing (or, with every thread doing it, deadlock).
    return body();
  }
  // else

  std::optional<Task_outcome<Result>> outcome;
  util::Mutex_non_recursive mutex;
  util::Condition_variable done_cond;
  bool done = false;

  loop->post([&]()
  {
    auto result = body();
    util::Lock_guard_non_recursive lock(mutex);
    outcome.emplace(std::move(result));
    done = true;
    done_cond.notify_one();
  });

  util::Lock_guard_non_recursive lock(mutex);
  done_cond.wait(lock, [&]() -> bool { return done; });
  return std::move(*outcome);
} // Dual_pool_engine::run_on()

TEMPLATE_DUAL_POOL_ENGINE
void CLASS_DUAL_POOL_ENGINE::fork_join_on(Loop* loop, std::vector<flow::async::Task>* thunks)
{
  const detail::Post_func post = [loop](flow::async::Task&& task)
  {
    loop->post(std::move(task));
  };

  if (detail::this_thread_pool() == loop)
  {
    detail::fork_join(post, thunks, 0, thunks->size());
    return;
  }
  // else

  /* Do the splitting from a pool thread, so that the halves run there and not in the (foreign) caller thread.
   * The caller just waits. */
  util::Mutex_non_recursive mutex;
  util::Condition_variable done_cond;
  bool done = false;

  loop->post([&]()
  {
    detail::fork_join(post, thunks, 0, thunks->size());
    util::Lock_guard_non_recursive lock(mutex);
    done = true;
    done_cond.notify_one();
  });

  util::Lock_guard_non_recursive lock(mutex);
  done_cond.wait(lock, [&]() -> bool { return done; });
} // Dual_pool_engine::fork_join_on()

TEMPLATE_DUAL_POOL_ENGINE
template<size_t Idx, typename Outcomes, typename Func_refs>
flow::async::Task CLASS_DUAL_POOL_ENGINE::net_thunk(Outcomes* outcomes, Func_refs* funcs,
                                                    std::vector<Lane>* lanes) // Static.
{
  using Result = typename std::tuple_element_t<Idx, Outcomes>::value_type::Result_obj;

  return [outcomes, funcs, lanes]()
  {
    std::get<Idx>(*outcomes).emplace(detail::invoke_capturing<Result>(std::get<Idx>(*funcs),
                                                                      (*lanes)[Idx].resource()));
  };
}

TEMPLATE_DUAL_POOL_ENGINE
template<size_t Idx, typename Outcomes, typename Func_refs>
flow::async::Task CLASS_DUAL_POOL_ENGINE::cpu_thunk(Outcomes* outcomes, Func_refs* funcs) // Static.
{
  using Result = typename std::tuple_element_t<Idx, Outcomes>::value_type::Result_obj;

  return [outcomes, funcs]()
  {
    std::get<Idx>(*outcomes).emplace(detail::invoke_capturing<Result>(std::get<Idx>(*funcs)));
  };
}

TEMPLATE_DUAL_POOL_ENGINE
template<typename Outcomes, typename Func_refs, size_t... Idx>
std::vector<flow::async::Task>
  CLASS_DUAL_POOL_ENGINE::make_net_thunks(Outcomes* outcomes, Func_refs* funcs, std::vector<Lane>* lanes,
                                          std::index_sequence<Idx...>) // Static.
{
  std::vector<flow::async::Task> thunks;
  thunks.reserve(sizeof...(Idx));
  (thunks.emplace_back(net_thunk<Idx>(outcomes, funcs, lanes)), ...);
  return thunks;
}

TEMPLATE_DUAL_POOL_ENGINE
template<typename Outcomes, typename Func_refs, size_t... Idx>
std::vector<flow::async::Task>
  CLASS_DUAL_POOL_ENGINE::make_cpu_thunks(Outcomes* outcomes, Func_refs* funcs,
                                          std::index_sequence<Idx...>) // Static.
{
  std::vector<flow::async::Task> thunks;
  thunks.reserve(sizeof...(Idx));
  (thunks.emplace_back(cpu_thunk<Idx>(outcomes, funcs)), ...);
  return thunks;
}

TEMPLATE_DUAL_POOL_ENGINE
template<typename... Results, size_t... Idx>
std::tuple<Results...>
  CLASS_DUAL_POOL_ENGINE::collect(std::tuple<std::optional<Task_outcome<Results>>...>* outcomes,
                                  std::index_sequence<Idx...>) // Static.
{
  // First failure in argument order wins.
  std::exception_ptr exc;
  ((exc = (!exc && !std::get<Idx>(*outcomes)->ok()) ? std::get<Idx>(*outcomes)->exception() : exc), ...);
  if (exc)
  {
    std::rethrow_exception(exc);
  }
  // else
  return std::tuple<Results...>(std::move(std::get<Idx>(*outcomes)->value())...);
}

TEMPLATE_DUAL_POOL_ENGINE
std::ostream& operator<<(std::ostream& os, const CLASS_DUAL_POOL_ENGINE& val)
{
  return os << "engine" << val.id() << '@' << &val;
}

#undef CLASS_DUAL_POOL_ENGINE
#undef TEMPLATE_DUAL_POOL_ENGINE

} // namespace mpcnet::engine
