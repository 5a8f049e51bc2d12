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

#include "mpcnet/common.hpp"
#include <flow/util/util_fwd.hpp>
#include <flow/util/blob_fwd.hpp>
#include <flow/util/string_view.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/thread/condition_variable.hpp>

/**
 * Miscellaneous aliases shared by the mpcnet modules, mostly to Flow and boost.asio types, so that the rest of
 * the code can say `util::Blob` and the like.
 */
namespace mpcnet::util
{

// Types.

/// Owning, resizable byte buffer: the payload type of a received message.
using Blob = flow::util::Blob_sans_log_context;

/// Read-only view of a contiguous byte range: the payload type of a message to send.
using Blob_const = boost::asio::const_buffer;

/// Writable view of a contiguous byte range.
using Blob_mutable = boost::asio::mutable_buffer;

/// Short-hand for Flow's `string_view` alias.
using String_view = flow::util::String_view;

/// Short-hand for the high-res duration type used for timeouts and backoffs.
using Fine_duration = flow::Fine_duration;

/// Short-hand for boost.asio execution context; owns I/O objects such as sockets.
using Task_engine = flow::util::Task_engine;

/// Short-hand for the boost.asio timer on Flow's high-res clock.
using Timer = flow::util::Timer;

/// Short-hand for the non-reentrant mutex used to guard internal state.
using Mutex_non_recursive = flow::util::Mutex_non_recursive;

/// Short-hand for the lock type that goes with #Mutex_non_recursive.
using Lock_guard_non_recursive = flow::util::Lock_guard_non_recursive;

/// Condition variable compatible with #Lock_guard_non_recursive.
using Condition_variable = boost::condition_variable;

} // namespace mpcnet::util
