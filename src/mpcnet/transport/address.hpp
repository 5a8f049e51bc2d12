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

#include "mpcnet/transport/transport_fwd.hpp"
#include <string>

namespace mpcnet::transport
{

// Types.

/**
 * Network address of one party: a host name (or numeric IP) and a TCP port, written `host:port`.
 *
 * The host part is resolved only when a connection is made (see Lane_config); hence an Address naming a host
 * that does not (yet) resolve is perfectly valid.  The string form contains exactly one `:`, so numeric IPv6
 * addresses are not expressible; use a host name for those.
 */
struct Address
{
  // Data.

  /// Host name or numeric IPv4 address.
  std::string m_host;

  /// TCP port.
  uint16_t m_port = 0;

  // Methods.

  /**
   * Parses `host:port`.  The string must contain exactly one `:`; the part after it must be a decimal number
   * in `[0, 65535]`.  The host part is not checked further.
   *
   * @param str
   *        String to parse.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_CFG_INVALID_ADDRESS (wrong number of colons, or port not a number in range).
   * @return The parsed Address; default-constructed on error.
   */
  static Address parse(util::String_view str, Error_code* err_code = 0);
}; // struct Address

} // namespace mpcnet::transport
