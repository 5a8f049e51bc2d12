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
#include <flow/util/blob.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <map>
#include <memory>

namespace mpcnet::transport
{

// Types.

/**
 * Lane of TLS-over-TCP connections.  Implements the Transport concept (see transport_fwd.hpp); otherwise like
 * Socket_transport, whose doc header applies except as noted here.
 *
 * ### Two connections per peer ###
 * A TLS session cannot be read and written concurrently from 2 threads without one lock around both, which would
 * make a receive from peer A block a send to peer A.  Therefore each (lane, peer) has 2 connections, each with its
 * own TLS session: one carrying data from the lower-ID party to the higher (*role* 0), the other the opposite
 * way (role 1).  The role is announced in a byte following the lane header (inside TLS).
 *
 * ### Trust ###
 * The lower-ID party of each pair is always the TLS client.  The server presents
 * `Tls_credentials::m_certificates_pem[self]` with the private key.  The client trusts exactly the set of all
 * parties' certificates and checks the certificate against the host name it connected to (from
 * Lane_config::m_party_addresses).  A rejected certificate fails establishment with
 * error::Code::S_CFG_CERTIFICATE_REJECTED.
 */
class Secure_transport :
  public flow::log::Log_context
{
public:
  // Types.

  /// Short-hand for the TLS stream type.
  using Ssl_stream = boost::asio::ssl::stream<boost::asio::ip::tcp::socket>;

  // Constructors/destructor.

  /**
   * Moves the connections from another lane into a new one.  `src` becomes unusable (except for destruction
   * and assignment).
   *
   * @param src
   *        Moved-from object.
   */
  Secure_transport(Secure_transport&& src);

  /// Closes all connections of this lane (without TLS close-notify).
  ~Secure_transport();

  // Methods.

  /**
   * Move-assignment.  Same semantics as move constructor.
   *
   * @param src
   *        Moved-from object.
   * @return `*this`.
   */
  Secure_transport& operator=(Secure_transport&& src);

  /**
   * Like Socket_transport::create_lanes(), but establishes 2 TLS connections per (lane, peer): for each lane,
   * first all role-0 connections, then all role-1 connections.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently (by the returned objects too).
   * @param cfg
   *        Config.
   * @param creds
   *        Certificates of all `cfg.n_parties()` parties, plus our private key.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  #Error_code generated:
   *        those of Socket_transport::create_lanes(); error::Code::S_CFG_CERTIFICATE_REJECTED (credentials
   *        unusable: wrong certificate count, unparseable PEM, key not matching certificate; or a peer's
   *        certificate failed verification); error::Code::S_HANDSHAKE_FAILED (TLS handshake failed otherwise).
   * @return The lanes; empty on error.
   */
  static std::vector<Secure_transport> create_lanes(flow::log::Logger* logger_ptr, const Lane_config& cfg,
                                                    const Tls_credentials& creds, Error_code* err_code = 0);

  /**
   * This party's ID.
   *
   * @return See above.
   */
  party_id_t id() const;

  /**
   * IDs of all other parties, ascending.
   *
   * @return See above.
   */
  std::vector<party_id_t> peer_ids() const;

  /**
   * Index of this lane in the `create_lanes()` result.
   *
   * @return See above.
   */
  size_t lane_idx() const;

  /**
   * Sends one message to the given peer.  Identical contract to Socket_transport::send().
   *
   * @param to
   *        Peer ID.
   * @param data
   *        Message; may be empty.
   * @param err_code
   *        See Socket_transport::send().
   */
  void send(party_id_t to, const util::Blob_const& data, Error_code* err_code = 0);

  /**
   * Receives the next message from the given peer.  Identical contract to Socket_transport::recv(); a
   * connection closed without TLS close-notify is reported as error::Code::S_SHORT_READ.
   *
   * @param from
   *        Peer ID.
   * @param err_code
   *        See Socket_transport::recv().
   * @return The message; empty on error.
   */
  util::Blob recv(party_id_t from, Error_code* err_code = 0);

private:
  // Types.

  /// One direction to/from one peer: a TLS session used for that direction only.
  struct Pipe
  {
    /// Execution context of #m_stream and nothing else.  Declared first, so it outlives #m_stream.
    std::unique_ptr<util::Task_engine> m_task_engine;

    /// Serializes operations on #m_stream.
    util::Mutex_non_recursive m_mutex;

    /// The TLS stream, handshake done.
    std::unique_ptr<Ssl_stream> m_stream;
  }; // struct Pipe

  /// Map from peer ID to one direction to/from it.
  using Pipe_map = std::map<party_id_t, std::unique_ptr<Pipe>>;

  // Constructors.

  /**
   * Constructs a lane with no connections yet.
   *
   * @param logger_ptr
   *        Logger.
   * @param client_ctx
   *        TLS client context of the session.
   * @param server_ctx
   *        TLS server context of the session.
   * @param self_id
   *        See id().
   * @param lane_idx
   *        See lane_idx().
   * @param send_timeout
   *        See Lane_config::m_send_timeout.
   */
  explicit Secure_transport(flow::log::Logger* logger_ptr,
                            std::shared_ptr<boost::asio::ssl::context> client_ctx,
                            std::shared_ptr<boost::asio::ssl::context> server_ctx,
                            party_id_t self_id, size_t lane_idx, util::Fine_duration send_timeout);

  // Methods.

  /**
   * Installs one direction to the given peer.
   *
   * @param peer
   *        Peer ID.
   * @param sending
   *        `true` if `stream` carries our data to `peer`; `false` if it carries `peer`'s data to us.
   * @param task_engine
   *        Execution context of `stream`.
   * @param stream
   *        Handshaken stream.
   */
  void add_pipe(party_id_t peer, bool sending, std::unique_ptr<util::Task_engine>&& task_engine,
                std::unique_ptr<Ssl_stream>&& stream);

  // Data.

  /// TLS client context; shared by all lanes of one session.
  std::shared_ptr<boost::asio::ssl::context> m_client_ctx;

  /// TLS server context; shared by all lanes of one session.
  std::shared_ptr<boost::asio::ssl::context> m_server_ctx;

  /// See id().
  party_id_t m_self_id;

  /// See lane_idx().
  size_t m_lane_idx;

  /// See Lane_config::m_send_timeout.
  util::Fine_duration m_send_timeout;

  /// Send direction per peer.
  Pipe_map m_send_pipes;

  /// Receive direction per peer.
  Pipe_map m_recv_pipes;
}; // class Secure_transport

} // namespace mpcnet::transport
