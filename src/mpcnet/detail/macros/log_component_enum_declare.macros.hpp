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

/// @cond
// -^- Doxygen, please ignore the following.  This is macro magic and not a regular `#pragma once` header.

/* This is included twice: once from mpcnet/detail/common.hpp (to generate `enum class Log_component`), once from
 * mpcnet/common.cpp (to populate S_MPCNET_LOG_COMPONENT_NAME_MAP).  Each line declares one component: its name
 * (sans `S_`) and its numeric value.  Keep the values contiguous starting at 0, and keep the highest one last. */

// Log call sites outside any more specific mpcnet::X namespace.
FLOW_LOG_CFG_COMPONENT_DEFINE(UNCAT, 0)
// mpcnet::transport: transports and connection establishment.
FLOW_LOG_CFG_COMPONENT_DEFINE(TRANSPORT, 1)
// mpcnet::pool: Resource_pool rotation and membership.
FLOW_LOG_CFG_COMPONENT_DEFINE(POOL, 2)
// mpcnet::engine: Dual_pool_engine dispatch, fan-out, handles.
FLOW_LOG_CFG_COMPONENT_DEFINE(ENGINE, 3)

// -v- Doxygen, please stop ignoring.
/// @endcond
