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

#include "mpcnet/detail/common.hpp"
#include <flow/log/log.hpp>
#include <flow/error/error.hpp>

#if (!defined(__cplusplus)) || (__cplusplus < 201703L)
#  error "To compile a translation unit that `#include`s any mpcnet/ API headers, use C++17 compile mode or later."
#endif

/**
 * Catch-all namespace for mpcnet: pooled peer-to-peer transport lanes for multi-party computation runtimes,
 * plus a dual thread-pool dispatcher that runs user closures against those lanes.
 *
 * The modules, leaves first:
 *   - mpcnet::transport: the Transport concept (identify self; send bytes to a peer; receive bytes from a peer)
 *     and its implementations (TCP, TLS, in-process, null), including multi-lane connection establishment.
 *   - mpcnet::pool: pool::Resource_pool, handing out interchangeable lanes in strict rotation.
 *   - mpcnet::engine: engine::Dual_pool_engine, whose network and compute thread pools run spawned, installed
 *     and fanned-out closures, sourcing lanes from a pool::Resource_pool.
 *
 * Logging is via flow::log: long-lived objects are `flow::log::Log_context`s tagged with a #Log_component.
 * Errors are `boost::system` codes; see transport::error.
 */
namespace mpcnet
{

// Types.

/// Short-hand for the error code type used throughout: `boost::system::error_code` a/k/a Flow's.
using Error_code = flow::Error_code;

/// Short-hand for polymorphic functor holder, `std::function` plus a couple of conveniences.
template<typename Signature>
using Function = flow::Function<Signature>;

#ifdef FLOW_DOXYGEN_ONLY // Compiler ignores; Doxygen sees.

/**
 * The flow::log::Component payload enumeration for all of mpcnet's logging.  The members are generated by macro
 * magic from mpcnet/detail/macros/log_component_enum_declare.macros.hpp; look there for the actual list.
 */
enum class Log_component
{
  /// Placeholder for Doxygen; see above.
  S_END_SENTINEL
};

/// Map from each #Log_component member to its string name, for flow::log::Config::init_component_names().
extern const boost::unordered_multimap<Log_component, std::string> S_MPCNET_LOG_COMPONENT_NAME_MAP;

#endif // FLOW_DOXYGEN_ONLY

} // namespace mpcnet
