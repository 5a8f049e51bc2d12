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

#include "mpcnet/transport/lane_config.hpp"
#include "mpcnet/transport/detail/framing.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <boost/noncopyable.hpp>
#include <set>
#include <tuple>

namespace mpcnet::transport::detail
{

// Types.

/**
 * TCP-level machinery of the connection establishment protocol (see Lane_config doc header), shared by
 * Socket_transport::create_lanes() and Secure_transport::create_lanes(): the listener, connect-with-retry,
 * accept, the order of steps, and validation of incoming lane headers.  What happens on top of the TCP
 * connection (TLS handshake, writing/reading the header, routing to a lane) is up to the transport.
 *
 * One instance serves one `create_lanes()` call and is then discarded.  Not thread-safe; all calls are
 * made from the thread running `create_lanes()`.
 */
class Lane_establisher :
  public flow::log::Log_context,
  private boost::noncopyable
{
public:
  // Types.

  /// Short-hand for the TCP socket type.
  using Socket = boost::asio::ip::tcp::socket;

  /// One step of the establishment protocol: one connection to open or accept.
  struct Step
  {
    /// Lane to which the connection will belong.
    size_t m_lane_idx;

    /// Direction tag (Secure_transport only).
    std::optional<uint8_t> m_role;

    /// If #m_initiate, the party to connect to; else the lower-ID party expected (informational only).
    party_id_t m_peer;

    /// `true` if we connect, `false` if we accept.
    bool m_initiate;
  }; // struct Step

  // Constructors/destructor.

  /**
   * Prepares establishment; does not open the listener yet.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.
   * @param task_engine
   *        Execution context for the listener and name resolution; must outlive `*this`.  It need not be
   *        running: all I/O here is synchronous.
   * @param cfg
   *        Config; must have passed Lane_config::validate().  Copied.
   * @param with_role
   *        `true` to produce 2 steps per (lane, peer), one per role, and to require role bytes in headers.
   */
  explicit Lane_establisher(flow::log::Logger* logger_ptr, util::Task_engine* task_engine,
                            const Lane_config& cfg, bool with_role);

  // Methods.

  /**
   * Binds and listens on `cfg.m_bind_address`.  Must be called once, before accept().
   *
   * @param err_code
   *        Must not be null.  Set to success or the system error from resolving, binding or listening.
   */
  void listen(Error_code* err_code);

  /**
   * The establishment steps, in the order they must be carried out: by lane, then (if `with_role`) by role,
   * then by peer ID.
   *
   * @return See above.
   */
  std::vector<Step> plan() const;

  /**
   * Connects to the given party, retrying forever (also through name resolution failures) with the configured
   * backoff until it accepts; then sets `TCP_NODELAY`.
   *
   * @param to
   *        Higher-ID party.
   * @param task_engine
   *        Execution context of the returned socket; must outlive it.
   * @param err_code
   *        Must not be null.  Set to success or the system error from setting socket options.
   * @return Connected socket (not open on error).
   */
  Socket connect(party_id_t to, util::Task_engine* task_engine, Error_code* err_code);

  /**
   * Accepts one connection on the listener; then sets `TCP_NODELAY`.
   *
   * @param task_engine
   *        Execution context of the returned socket; must outlive it.
   * @param err_code
   *        Must not be null.  Set to success or the system error from accepting.
   * @return Connected socket (not open on error).
   */
  Socket accept(util::Task_engine* task_engine, Error_code* err_code);

  /**
   * Validates the header received on an accepted connection and, if valid, records the (lane, origin, role)
   * as connected.
   *
   * @param hdr
   *        Header read from the connection.
   * @param err_code
   *        Must not be null.  Set to success or error::Code::S_HANDSHAKE_FAILED: lane index out of range; origin
   *        not a lower-ID party; role missing or not 0 or 1; or (lane, origin, role) seen already.
   */
  void check_incoming(const Lane_header& hdr, Error_code* err_code);

  /**
   * The config given to the constructor.
   *
   * @return See above.
   */
  const Lane_config& config() const;

private:
  // Data.

  /// See config().
  const Lane_config m_cfg;

  /// See constructor.
  const bool m_with_role;

  /// Execution context of #m_acceptor.
  util::Task_engine* const m_task_engine;

  /// Listener; open after listen().
  boost::asio::ip::tcp::acceptor m_acceptor;

  /// (lane, origin, role-or-0) of each connection accepted so far.
  std::set<std::tuple<uint64_t, uint64_t, uint8_t>> m_seen;
}; // class Lane_establisher

} // namespace mpcnet::transport::detail
