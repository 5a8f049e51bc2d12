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

#include <flow/common.hpp>
#include <boost/unordered_map.hpp>

namespace mpcnet
{

/// @cond
// -^- Doxygen, please ignore the following.  common.hpp documents the relevant items.

/* The flow::log-recommended trio of #includes below generates mpcnet's own flow::log::Component-compatible
 * enumeration, `enum class Log_component`, and declares (but does not populate) the multimap
 * S_MPCNET_LOG_COMPONENT_NAME_MAP from each member to its string name.  common.cpp populates the map.
 *
 * flow/common.hpp (included above) has already used the same two configuration macros for Flow's own
 * Flow_log_component; hence the #undef before we point them at ours. */

#undef FLOW_LOG_CFG_COMPONENT_ENUM_CLASS
#undef FLOW_LOG_CFG_COMPONENT_ENUM_NAME_MAP
#define FLOW_LOG_CFG_COMPONENT_ENUM_CLASS Log_component
#define FLOW_LOG_CFG_COMPONENT_ENUM_NAME_MAP S_MPCNET_LOG_COMPONENT_NAME_MAP

#include <flow/log/macros/config_enum_start_hdr.macros.hpp>
#include "mpcnet/detail/macros/log_component_enum_declare.macros.hpp"
#include <flow/log/macros/config_enum_end_hdr.macros.hpp>

// -v- Doxygen, please stop ignoring.
/// @endcond

} // namespace mpcnet
