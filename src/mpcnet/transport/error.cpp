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
#include "mpcnet/transport/error.hpp"
#include "mpcnet/util/util_fwd.hpp"
#include <flow/util/util.hpp>

namespace mpcnet::transport::error
{

// Types.

/**
 * The boost.system category for errors returned by the mpcnet::transport module.  Think of it as the
 * polymorphic counterpart of Code, and it kicks in when, for example, `Error_code::message()` is invoked.
 */
class Category :
  public boost::system::error_category
{
public:
  // Constants.

  /// The one Category.
  static const Category S_CATEGORY;

  // Methods.

  /**
   * Returns a `static` string representing this category's conceptual name.
   *
   * @return See above.
   */
  const char* name() const noexcept override;

  /**
   * Given the integer value of a Code, returns a description of that error, as in `Error_code::message()`.
   *
   * @param val
   *        Value of a Code.
   * @return See above.
   */
  std::string message(int val) const override;

  /**
   * Returns the brief symbolic name of the given Code, sans `S_` prefix, suitable for `operator<<()`.
   *
   * @param code
   *        The code.
   * @return See above.
   */
  static util::String_view code_symbol(Code code);

private:
  // Constructors.

  /// Boring constructor.
  explicit Category();
}; // class Category

// Static initializations.

const Category Category::S_CATEGORY;

// Implementations.

Error_code make_error_code(Code err_code)
{
  // Glues together Category::name()/message() with the Code enum.
  return Error_code(static_cast<int>(err_code), Category::S_CATEGORY);
}

Category::Category() = default;

const char* Category::name() const noexcept // Virtual.
{
  return "mpcnet/transport";
}

std::string Category::message(int val) const // Virtual.
{
  // KEEP THESE STRINGS IN SYNC WITH COMMENT IN error.hpp ON THE INDIVIDUAL ENUM MEMBERS!

  switch (static_cast<Code>(val))
  {
  case Code::S_CONNECT_FAILED:
    return "Connection establishment: could not open a connection to a peer.";
  case Code::S_TIMEOUT:
    return "Receive: no message from the peer arrived within the transport's receive timeout.";
  case Code::S_SHORT_READ:
    return "Receive: the peer's stream ended before a complete message frame arrived.";
  case Code::S_UNKNOWN_PEER:
    return "Send/receive: the given party ID is not among this transport's peers.";
  case Code::S_HANDSHAKE_FAILED:
    return "Connection establishment: an incoming connection's header was malformed, named an out-of-range lane, "
           "a party not expected to connect to us, a (lane, direction) already connected, or an unknown role tag; "
           "or the TLS handshake failed.";
  case Code::S_CFG_INVALID_ADDRESS:
    return "Configuration: an address string could not be parsed as `host:port`, or its port is not a valid number.";
  case Code::S_CFG_CERTIFICATE_REJECTED:
    return "Configuration: a certificate or private key could not be loaded, or the peer's certificate was "
           "rejected.";
  case Code::S_MESSAGE_TOO_LARGE:
    return "Send: the message is too large to be described by the 32-bit frame length prefix.";
  case Code::S_CFG_INVALID_PARTY_ID:
    return "Configuration: self party ID is out of range of the party address list.";
  case Code::S_CFG_INVALID_LANE_COUNT:
    return "Configuration: the lane count must be at least 1.";

  case Code::S_END_SENTINEL:
    assert(false && "SENTINEL: Not an error.  "
                    "This Code must never be issued by an error/success-emitting API; I/O use only.");
  }
  assert(false);
  return "";
} // Category::message()

util::String_view Category::code_symbol(Code code) // Static.
{
  // Note: Must satisfy istream_to_enum() requirements.

  switch (code)
  {
  case Code::S_CONNECT_FAILED:
    return "CONNECT_FAILED";
  case Code::S_TIMEOUT:
    return "TIMEOUT";
  case Code::S_SHORT_READ:
    return "SHORT_READ";
  case Code::S_UNKNOWN_PEER:
    return "UNKNOWN_PEER";
  case Code::S_HANDSHAKE_FAILED:
    return "HANDSHAKE_FAILED";
  case Code::S_CFG_INVALID_ADDRESS:
    return "CFG_INVALID_ADDRESS";
  case Code::S_CFG_CERTIFICATE_REJECTED:
    return "CFG_CERTIFICATE_REJECTED";
  case Code::S_MESSAGE_TOO_LARGE:
    return "MESSAGE_TOO_LARGE";
  case Code::S_CFG_INVALID_PARTY_ID:
    return "CFG_INVALID_PARTY_ID";
  case Code::S_CFG_INVALID_LANE_COUNT:
    return "CFG_INVALID_LANE_COUNT";

  case Code::S_END_SENTINEL:
    return "END_SENTINEL";
  }
  assert(false);
  return "";
}

std::ostream& operator<<(std::ostream& os, Code val)
{
  // Note: Must satisfy istream_to_enum() requirements.
  return os << Category::code_symbol(val);
}

std::istream& operator>>(std::istream& is, Code& val)
{
  /* Range [<1st Code>, END_SENTINEL); no match => END_SENTINEL;
   * allow for number instead of ostream<< string; case-insensitive. */
  val = flow::util::istream_to_enum(&is, Code::S_END_SENTINEL, Code::S_END_SENTINEL, true, false,
                                    Code(S_CODE_LOWEST_INT_VALUE));
  return is;
}

} // namespace mpcnet::transport::error
