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

#include "mpcnet/transport/address.hpp"
#include <boost/chrono/chrono.hpp>
#include <vector>
#include <string>

namespace mpcnet::transport
{

// Types.

/**
 * Inputs to the connection establishment protocol run by Socket_transport::create_lanes() and
 * Secure_transport::create_lanes(): who we are, where everyone is, and how many lanes to build.
 *
 * The protocol, given self ID `P`, `N` parties and `L` lanes: we listen on #m_bind_address; then for each lane
 * `i` in `[0, L)`, and for each other party `q` in ID order, if `P < q` we connect to `m_party_addresses[q]`,
 * else we accept one connection on our listener.  Connects retry forever, sleeping #m_connect_backoff between
 * attempts, so parties may be started in any order.  (Secure_transport does all of that twice per lane: once
 * per direction.)  Each connection is announced with a header naming its lane and origin party, so the accepting
 * side routes it correctly regardless of arrival order.
 *
 * Loading these values from files or command lines is up to the user.  This is a plain aggregate; it is
 * checked by validate() (which the factories call).
 */
struct Lane_config
{
  // Constants.

  /// Default for #m_connect_backoff.
  static const util::Fine_duration S_DEFAULT_CONNECT_BACKOFF;

  /// Default for #m_send_timeout.
  static const util::Fine_duration S_DEFAULT_SEND_TIMEOUT;

  // Data.

  /// This party's ID: index into #m_party_addresses.
  party_id_t m_self_id = 0;

  /// Address on which to listen for connections from lower-ID parties.  Typically `0.0.0.0:<own port>`.
  Address m_bind_address;

  /// Address of each party, indexed by party ID; the entry at #m_self_id is ignored for connecting.
  std::vector<Address> m_party_addresses;

  /// How many lanes (independent full sets of connections) to establish; at least 1.
  size_t m_n_lanes = 1;

  /// Pause between connect attempts to a not-yet-listening or not-yet-resolvable peer.
  util::Fine_duration m_connect_backoff = S_DEFAULT_CONNECT_BACKOFF;

  /**
   * Longest a `send()` may block waiting for the peer to take the bytes; zero means no limit.  On expiry `send()`
   * reports error::Code::S_TIMEOUT, and the connection to that peer is left mid-frame: the lane is then unusable.
   */
  util::Fine_duration m_send_timeout = S_DEFAULT_SEND_TIMEOUT;

  // Methods.

  /**
   * Checks the values for consistency: #m_self_id must index #m_party_addresses; every other party's address
   * must have a non-empty host and a non-zero port; #m_bind_address must have a non-empty host; #m_n_lanes must be
   * positive.
   *
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_CFG_INVALID_PARTY_ID, error::Code::S_CFG_INVALID_ADDRESS,
   *        error::Code::S_CFG_INVALID_LANE_COUNT.
   */
  void validate(Error_code* err_code = 0) const;

  /**
   * Number of parties, `N`.
   *
   * @return See above.
   */
  size_t n_parties() const;
}; // struct Lane_config

/**
 * TLS identity material for Secure_transport: every party's certificate (in PEM form), indexed by party ID,
 * plus this party's private key (PEM).
 *
 * Each party presents `m_certificates_pem[self]` when acting as TLS server; as TLS client it trusts exactly
 * the set of all parties' certificates and additionally checks that the server's certificate names the host
 * it connected to.  Self-signed per-party certificates are therefore fine.
 */
struct Tls_credentials
{
  // Data.

  /// PEM text of each party's certificate, indexed by party ID.
  std::vector<std::string> m_certificates_pem;

  /// PEM text of this party's private key, matching `m_certificates_pem[self]`.
  std::string m_private_key_pem;

  // Methods.

  /**
   * Reads the given PEM files into a Tls_credentials.
   *
   * @param certificate_paths
   *        Path of each party's certificate file, indexed by party ID.
   * @param private_key_path
   *        Path of this party's private key file.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        error::Code::S_CFG_CERTIFICATE_REJECTED (a file could not be read, or is empty).
   * @return The loaded credentials; empty on error.
   */
  static Tls_credentials load(const std::vector<std::string>& certificate_paths,
                              const std::string& private_key_path,
                              Error_code* err_code = 0);
}; // struct Tls_credentials

} // namespace mpcnet::transport
