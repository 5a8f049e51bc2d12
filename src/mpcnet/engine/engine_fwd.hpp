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

#include "mpcnet/util/util_fwd.hpp"
#include <type_traits>

/**
 * Dispatch of protocol work onto 2 thread pools (one for network-bound steps, each given its own transport lane,
 * one for compute-bound steps), with completion reporting.  See Dual_pool_engine.
 */
namespace mpcnet::engine
{

// Types.

/// Result of a closure whose return type is `void`: an empty value, so that every result fits in a tuple/outcome.
struct Void_result
{
};

// Find doc headers near the bodies of these compound types.

template<typename Result>
class Task_outcome;
template<typename Result>
class Handle;
template<typename Transport_obj>
class Dual_pool_engine;

// Free functions.

/**
 * Returns `true`: all `Void_result`s are equal.
 *
 * @relatesalso Void_result
 *
 * @return See above.
 */
inline bool operator==(const Void_result&, const Void_result&)
{
  return true;
}

/**
 * Prints string representation of the given `Dual_pool_engine` to the given `ostream`.
 *
 * @relatesalso Dual_pool_engine
 *
 * @tparam Transport_obj
 *         See Dual_pool_engine.
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
template<typename Transport_obj>
std::ostream& operator<<(std::ostream& os, const Dual_pool_engine<Transport_obj>& val);

} // namespace mpcnet::engine

namespace mpcnet::engine::detail
{

// Types.

/**
 * The result type reported for a closure of type `Func` invoked (as an lvalue) with `Args&...`: its return type,
 * decayed; or Void_result if that is `void`.
 *
 * @tparam Func
 *         Closure type.
 * @tparam Args
 *         Argument types.
 */
template<typename Func, typename... Args>
using Result_of_t = std::conditional_t<std::is_void_v<std::invoke_result_t<std::decay_t<Func>&, Args&...>>,
                                       Void_result,
                                       std::decay_t<std::invoke_result_t<std::decay_t<Func>&, Args&...>>>;

} // namespace mpcnet::engine::detail
