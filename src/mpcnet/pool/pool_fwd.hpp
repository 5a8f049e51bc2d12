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

/**
 * Pooling of interchangeable resources (in practice, transport lanes) among concurrent users, with strictly
 * rotating hand-out.  See Resource_pool.
 */
namespace mpcnet::pool
{

// Types.

// Find doc headers near the bodies of these compound types.

template<typename Resource>
class Resource_pool;
template<typename Resource>
class Lane_guard;

// Free functions.

/**
 * Prints string representation of the given `Resource_pool` to the given `ostream`.
 *
 * @relatesalso Resource_pool
 *
 * @tparam Resource
 *         See Resource_pool.
 * @param os
 *         Stream to which to write.
 * @param val
 *         Object to serialize.
 * @return `os`.
 */
template<typename Resource>
std::ostream& operator<<(std::ostream& os, const Resource_pool<Resource>& val);

} // namespace mpcnet::pool
