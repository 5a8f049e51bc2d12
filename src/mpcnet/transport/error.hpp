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

/**
 * Namespace containing the mpcnet::transport module's extension of boost.system error conventions, so that
 * transport APIs can return codes/messages from within their own new set of error codes.
 *
 * A transport API in this library emits either one of these codes or a `boost::system` code passed through from
 * the OS (e.g., `connection_reset`, `address_in_use` on bind).  Like Flow, each such API takes an
 * `Error_code* err_code = 0` last argument: if non-null, `*err_code` is set (to success, or an error) and the call
 * returns normally; if null and an error occurs, a `flow::error::Runtime_error` wrapping the code is thrown.
 *
 * The `S_CFG_*` codes describe bad configuration (addresses, credentials, sizes); the rest describe failures
 * in establishing or using a connection.
 */
namespace mpcnet::transport::error
{

// Types.

/// Numeric value of the lowest Code.
constexpr int S_CODE_LOWEST_INT_VALUE = 1;

/// All possible errors returned (via `Error_code` arguments) by mpcnet::transport functions/methods *outside of*
/// `boost::system` errors passed through from the OS or boost.asio.
enum class Code
{
  /// Connection establishment: could not open a connection to a peer.
  S_CONNECT_FAILED = S_CODE_LOWEST_INT_VALUE,

  /// Receive: no message from the peer arrived within the transport's receive timeout.
  S_TIMEOUT,

  /// Receive: the peer's stream ended before a complete message frame arrived.
  S_SHORT_READ,

  /// Send/receive: the given party ID is not among this transport's peers.
  S_UNKNOWN_PEER,

  /**
   * Connection establishment: an incoming connection's header was malformed, named an out-of-range lane,
   * a party not expected to connect to us, a (lane, direction) already connected, or an unknown role tag;
   * or the TLS handshake failed.
   */
  S_HANDSHAKE_FAILED,

  /// Configuration: an address string could not be parsed as `host:port`, or its port is not a valid number.
  S_CFG_INVALID_ADDRESS,

  /// Configuration: a certificate or private key could not be loaded, or the peer's certificate was rejected.
  S_CFG_CERTIFICATE_REJECTED,

  /// Send: the message is too large to be described by the 32-bit frame length prefix.
  S_MESSAGE_TOO_LARGE,

  /// Configuration: self party ID is out of range of the party address list.
  S_CFG_INVALID_PARTY_ID,

  /// Configuration: the lane count must be at least 1.
  S_CFG_INVALID_LANE_COUNT,

  /// SENTINEL: Not an error.  This Code must never be issued by an error/success-emitting API; I/O use only.
  S_END_SENTINEL
}; // enum class Code

// Free functions.

/**
 * Given a `Code` `enum` value, creates a lightweight flow::Error_code (a/k/a boost.system `error_code`)
 * representing that error.  This is needed to make the `boost::system::error_code::error_code<Code>()`
 * template implementation work.  Or, slightly more in English, it glues the (completely general) `Error_code`
 * to the (mpcnet::transport-specific) error code set, so that one can implicitly covert from the latter to the
 * former.
 *
 * @param err_code
 *        The `enum` value.
 * @return Corresponding `Error_code`.
 */
Error_code make_error_code(Code err_code);

/**
 * Deserializes a transport::error::Code from a standard input stream.  Reads up to but not including the next
 * non-alphanumeric-or-underscore character; the resulting string is then mapped to a Code.  If none is
 * recognized, Code::S_END_SENTINEL is the result.  The recognized values are:
 *   - Code's symbol sans the `S_` prefix, as output by `operator<<()`: case-insensitive.
 *   - The number that the Code's `enum` value's numeric representation represents.
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Code& val);

/**
 * Serializes a transport::error::Code to a standard output stream.  This is the inverse of `operator>>()`.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Code val);

} // namespace mpcnet::transport::error

namespace boost::system
{

// Types.

/**
 * Specializes this `struct` so that boost.system accepts `enum` `Code` as convertible to `Error_code`.  The
 * non-specialized version sets `value` to `false`, so arbitrary `enum`s cannot be used as `Error_code`s.  This is
 * the documented way of hooking a custom error set into boost.system.
 */
template<>
struct is_error_code_enum<::mpcnet::transport::error::Code>
{
  /// Means `Code` `enum` values can be used for `Error_code`.
  static const bool value = true;
};

} // namespace boost::system
